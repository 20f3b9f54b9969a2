/** \file    TreeWalker.cc
 *  \brief   Implementation of class TreeWalker.
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
#include "TreeWalker.h"
#include <stdexcept>
#include "util.h"


TreeWalker::TreeWalker(const std::string &root, const std::set<std::string> &excluded_names)
    : excluded_names_(excluded_names), excluded_count_(0)
{
    for (const auto &component : FileUtil::SplitPathComponents(root)) {
        if (isExcluded(component)) {
            LOG_DEBUG("\"" + root + "\" contains the excluded component \"" + component + "\".");
            ++excluded_count_;
            return;
        }
    }

    descend(root);
}


void TreeWalker::descend(const std::string &path) {
    try {
        open_directories_.emplace(new OpenDirectory(path));
    } catch (const std::runtime_error &x) {
        LOG_DEBUG(x.what());
    }
}


bool TreeWalker::getNext(std::string * const path) {
    while (not open_directories_.empty()) {
        OpenDirectory &current(*open_directories_.top());
        if (current.entry_ == current.end_) {
            open_directories_.pop();
            continue;
        }

        const FileUtil::Directory::Entry entry(*current.entry_);
        try {
            ++current.entry_;
        } catch (const std::runtime_error &x) {
            // Abandon the rest of this directory but still process the entry we already have.
            LOG_DEBUG(x.what());
            open_directories_.pop();
        }

        if (isExcluded(entry.getName())) {
            ++excluded_count_;
            continue;
        }

        switch (entry.getType()) {
        case DT_DIR:
            descend(entry.getFullName());
            break;
        case DT_LNK:
            if (FileUtil::IsDirectory(entry.getFullName())) {
                LOG_DEBUG("not following the directory symlink \"" + entry.getFullName() + "\".");
                break;
            }
            *path = entry.getFullName();
            return true;
        case DT_UNKNOWN:
            LOG_DEBUG("can't determine the type of \"" + entry.getFullName() + "\".");
            break;
        default:
            *path = entry.getFullName();
            return true;
        }
    }

    return false;
}
