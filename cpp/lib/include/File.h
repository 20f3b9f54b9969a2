/** \file    File.h
 *  \brief   Declaration of class File.
 *
 *  \copyright 2015-2026 Universitätsbibliothek Tübingen.  All rights reserved.
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


#include <stdexcept>
#include <string>
#include <cstdio>
#include <sys/types.h>
#include "Compiler.h"


class File {
public:
    enum ThrowOnOpenBehaviour { THROW_ON_ERROR, DO_NOT_THROW_ON_ERROR };

private:
    enum OpenMode { READING, WRITING, READING_AND_WRITING };

private:
    std::string filename_;
    FILE *file_;
    OpenMode open_mode_;

public:
    /** \brief  Creates and initalises a File object.
     *  \param  path                      The pathname for the file (see fopen(3) for details).
     *  \param  mode                      The open mode, one of "r", "w", "a" or "r+" (see fopen(3) for details).
     *  \param  throw_on_error_behaviour  If true, any open failure will cause an exception to be thrown.  If not true
     *                                    you must use the fail() member function.  In the latter case "errno" holds the
     *                                    reason for the failure right after construction.
     */
    File(const std::string &filename, const std::string &mode,
         const ThrowOnOpenBehaviour throw_on_error_behaviour = DO_NOT_THROW_ON_ERROR);
    File(const File &rhs) = delete;
    File &operator=(const File &rhs) = delete;

    ~File() {
        if (file_ != nullptr)
            std::fclose(file_);
    }

    /** Closes this File.  If this fails you may consult the global "errno" for the reason. */
    bool close();

    inline bool isOpen() const { return file_ != nullptr; }

    /** \brief  Read some data from a file.
     *  \param  buf       The data to read.
     *  \param  buf_size  How much data to read.
     *  \return Returns a short count if an error occurred or EOF was encountered, otherwise returns "buf_size".
     *  \note   On returning a short count you need to call either eof() or anErrorOccurred() in order to
     *          determine whether the short count is due to an error condition or EOF.
     */
    size_t read(void * const buf, const size_t buf_size);

    /** \brief  Write some data to a file.
     *  \param  buf       The data to write.
     *  \param  buf_size  How much data to write.
     *  \return Returns a short count if an error occurred, otherwise returns "buf_size".
     */
    size_t write(const void * const buf, const size_t buf_size);

    /** \return True if all of "data" has been written, else false. */
    inline bool write(const std::string &data) { return write(data.data(), data.size()) == data.size(); }

    const std::string &getPath() const { return filename_; }

    inline bool anErrorOccurred() const { return std::ferror(file_) != 0; }

    /** Will the next I/O operation fail? */
    inline bool fail() const { return file_ == nullptr or std::feof(file_) != 0 or std::ferror(file_) != 0; }

    inline bool operator!() const { return fail(); }

    /** \brief  Flush all internal I/O buffers.
     *  \return True on success and false on failure.  Sets errno if there is a failure. */
    inline bool flush() const { return std::fflush(file_) == 0; }
};
