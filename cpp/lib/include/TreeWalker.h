/** \file    TreeWalker.h
 *  \brief   Lazy recursive enumeration of the non-directory entries below a directory.
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


#include <memory>
#include <set>
#include <stack>
#include <string>
#include "FileUtil.h"


/** \class TreeWalker
 *  \brief Yields the paths of all files, symlinks and special files below a root directory.
 *  \note  Directories themselves are never yielded.  Symlinks to directories are neither yielded nor followed.  Any path
 *         w/ a component that is one of the excluded names is skipped, and so is everything below it.  Unreadable
 *         subdirectories are skipped w/ a debug message.
 */
class TreeWalker {
    struct OpenDirectory {
        FileUtil::Directory directory_;
        FileUtil::Directory::const_iterator entry_;
        FileUtil::Directory::const_iterator end_;

        explicit OpenDirectory(const std::string &path)
            : directory_(path), entry_(directory_.begin()), end_(directory_.end()) { }
    };

    const std::set<std::string> excluded_names_;
    std::stack<std::unique_ptr<OpenDirectory>> open_directories_;
    unsigned excluded_count_;

public:
    /** \param root            The directory to walk.  Yielded paths start w/ "root" verbatim.
     *  \param excluded_names  Entry names that are skipped, compared case-sensitively.  If one of the components of
     *                         "root" is one of these, nothing at all is yielded.
     */
    TreeWalker(const std::string &root, const std::set<std::string> &excluded_names);
    TreeWalker(const TreeWalker &rhs) = delete;
    TreeWalker &operator=(const TreeWalker &rhs) = delete;

    /** \return False when there are no more entries, o/w true and "path" will hold the path of the next entry. */
    bool getNext(std::string * const path);

    /** \return How many entries, including possibly the root itself, were skipped due to an excluded name. */
    unsigned getExcludedCount() const { return excluded_count_; }

private:
    bool isExcluded(const std::string &name) const { return excluded_names_.find(name) != excluded_names_.cend(); }
    void descend(const std::string &path);
};
