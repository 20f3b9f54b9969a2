/** \file    TextAggregator.h
 *  \brief   Concatenates the textual files below a set of paths into a single tagged output document.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#pragma once


#include <set>
#include <string>
#include "ContentInspector.h"
#include "File.h"


/** \class TextAggregator
 *  \brief Appends one block of the form "<path>\ncontents\n</path>\n\n" to an output file for each textual file it is
 *         handed, either directly or by walking a directory.
 *  \note  No failure, except for a failure to write to the output file, is fatal.  All failures are logged as
 *         warnings and counted.
 */
class TextAggregator {
public:
    struct Config {
        std::string output_path_;
        std::set<std::string> excluded_directory_names_;
        std::string working_directory_;
        size_t sample_size_;
        std::string content_inspector_;

        Config()
            : output_path_("output.txt"), excluded_directory_names_{ ".git" }, sample_size_(512), content_inspector_("heuristic") { }
    };

    struct Statistics {
        unsigned emitted_count_;
        unsigned non_text_count_;
        unsigned excluded_count_;
        unsigned failure_count_;

        Statistics(): emitted_count_(0), non_text_count_(0), excluded_count_(0), failure_count_(0) { }
        std::string toString() const;
    };

private:
    const Config config_;
    File * const output_;
    const ContentInspector &content_inspector_;
    Statistics statistics_;

public:
    /** \param config     "working_directory_" must be an absolute path.
     *  \param output     Where the blocks go.  We don't take ownership.
     *  \param inspector  Decides which files are textual.
     */
    TextAggregator(const Config &config, File * const output, const ContentInspector &inspector);
    TextAggregator(const TextAggregator &rhs) = delete;
    TextAggregator &operator=(const TextAggregator &rhs) = delete;

    /** \brief Emits "path" if it is a regular file, or all files below it if it is a directory.
     *  \note  Symlinks are followed.  Missing paths and special files are logged and skipped.
     */
    void processPath(const std::string &path);

    /** Emits all files below "directory_path", w/ the exception of the ones below excluded directory names. */
    void processDirectory(const std::string &directory_path);

    /** \return True if a block for "path" has been written, false if it was skipped, either because it is not textual
     *          or because of a failure.  Failures, including ones of the content inspector, are logged and counted but
     *          never propagated.
     */
    bool emitFile(const std::string &path);

    const Statistics &getStatistics() const { return statistics_; }
    const Config &getConfig() const { return config_; }

    /** \return "path" relative to "working_directory" if it is located below it, o/w "path" unchanged. */
    static std::string MakeDisplayPath(const std::string &path, const std::string &working_directory);

private:
    bool readSample(File * const input, std::string * const sample);
    bool isValidContent(const ContentType content_type, const std::string &content) const;
};
