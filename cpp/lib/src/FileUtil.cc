/** \file   FileUtil.cc
 *  \brief  Implementation of file related utility classes and functions.
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
#include "FileUtil.h"
#include <exception>
#include <stdexcept>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <linux/limits.h>
#include "Compiler.h"
#include "StringUtil.h"
#include "util.h"


namespace FileUtil {


Directory::const_iterator::const_iterator(const std::string &path, const bool end): dir_handle_(nullptr), entry_(path) {
    if (end)
        return;

    if ((dir_handle_ = ::opendir(path.c_str())) == nullptr)
        throw std::runtime_error("in Directory::const_iterator::const_iterator: opendir(3) on \"" + path + "\" failed! ("
                                 + std::string(std::strerror(errno)) + ")");

    advance();
}


Directory::const_iterator::~const_iterator() {
    if (dir_handle_ != nullptr)
        ::closedir(dir_handle_);
}


void Directory::const_iterator::advance() {
    if (dir_handle_ == nullptr)
        return;

    for (;;) {
        errno = 0;
        struct dirent *entry_ptr;
        if (unlikely((entry_ptr = ::readdir(dir_handle_)) == nullptr and errno != 0))
            throw std::runtime_error("in Directory::const_iterator::advance: readdir(3) on \"" + entry_.dirname_ + "\" failed! ("
                                     + std::string(std::strerror(errno)) + ")");

        // Reached end-of-directory?
        if (entry_ptr == nullptr) { // Yes!
            ::closedir(dir_handle_);
            dir_handle_ = nullptr;
            return;
        }

        if (std::strcmp(entry_ptr->d_name, ".") == 0 or std::strcmp(entry_ptr->d_name, "..") == 0)
            continue;

        entry_.name_ = entry_ptr->d_name;
        if (::lstat(entry_.getFullName().c_str(), &entry_.statbuf_) == 0)
            return;
        if (errno == ENOENT) // Somebody removed the entry after we read it.
            continue;

        std::memset(&entry_.statbuf_, 0, sizeof(entry_.statbuf_));
        return;
    }
}


const Directory::Entry &Directory::const_iterator::operator*() const {
    if (dir_handle_ == nullptr)
        throw std::runtime_error("in Directory::const_iterator::operator*: can't dereference an iterator pointing to the end!");
    return entry_;
}


void Directory::const_iterator::operator++() {
    advance();
}


bool Directory::const_iterator::operator==(const const_iterator &rhs) const {
    if (rhs.dir_handle_ == nullptr and dir_handle_ == nullptr)
        return true;
    if (rhs.dir_handle_ == nullptr or dir_handle_ == nullptr)
        return false;

    return rhs.entry_.name_ == entry_.name_;
}


AutoTempDirectory::AutoTempDirectory(const std::string &path_prefix, const bool cleanup_if_exception_is_active,
                                     const bool remove_when_out_of_scope)
    : cleanup_if_exception_is_active_(cleanup_if_exception_is_active), remove_when_out_of_scope_(remove_when_out_of_scope)
{
    std::string path_template(path_prefix + "XXXXXX");
    const char * const path(::mkdtemp(const_cast<char *>(path_template.c_str())));
    if (path == nullptr)
        LOG_ERROR("mkdtemp(3) for path prefix \"" + path_prefix + "\" failed!");
    char resolved_path[PATH_MAX];
    if (unlikely(::realpath(path, resolved_path) == nullptr))
        LOG_ERROR("realpath(3) for path \"" + std::string(path) + "\" failed!");
    path_ = resolved_path;
}


AutoTempDirectory::~AutoTempDirectory() {
    if (not IsDirectory(path_))
        LOG_ERROR("\"" + path_ + "\" doesn't exist anymore!");

    if (remove_when_out_of_scope_ and ((not std::uncaught_exceptions() or cleanup_if_exception_is_active_) and not RemoveDirectory(path_)))
        LOG_ERROR("can't remove \"" + path_ + "\"!");
}


bool WriteString(const std::string &path, const std::string &data) {
    File output(path, "w");
    if (output.fail())
        return false;

    return output.write(data) and output.close();
}


void WriteStringOrDie(const std::string &path, const std::string &data) {
    if (not FileUtil::WriteString(path, data))
        LOG_ERROR("failed to write data to \"" + path + "\"!");
}


bool ReadString(const std::string &path, std::string * const data) {
    data->clear();

    File input(path, "r");
    if (input.fail())
        return false;

    char buf[BUFSIZ];
    size_t count;
    while ((count = input.read(buf, sizeof(buf))) > 0)
        data->append(buf, count);

    return not input.anErrorOccurred();
}


std::string ReadStringOrDie(const std::string &path) {
    std::string data;
    if (not FileUtil::ReadString(path, &data))
        LOG_ERROR("failed to read \"" + path + "\"!");
    return data;
}


static bool Stat(struct stat * const stat_buf, const std::string &path, std::string * const error_message) {
    errno = 0;

    if (::stat(path.c_str(), stat_buf) != 0) {
        if (error_message != nullptr)
            *error_message = "can't stat(2) \"" + path + "\": " + std::string(std::strerror(errno));
        errno = 0;
        return false;
    }

    return true;
}


bool Exists(const std::string &path, std::string * const error_message) {
    struct stat stat_buf;
    return Stat(&stat_buf, path, error_message);
}


bool IsDirectory(const std::string &path) {
    struct stat stat_buf;
    return Stat(&stat_buf, path, nullptr) and S_ISDIR(stat_buf.st_mode);
}


bool IsRegularFile(const std::string &path) {
    struct stat stat_buf;
    return Stat(&stat_buf, path, nullptr) and S_ISREG(stat_buf.st_mode);
}


std::string GetCurrentWorkingDirectory() {
    char buf[PATH_MAX];
    const char * const current_working_dir(::getcwd(buf, sizeof buf));
    if (unlikely(current_working_dir == nullptr))
        throw std::runtime_error("in FileUtil::GetCurrentWorkingDirectory: getcwd(3) failed (" + std::string(std::strerror(errno)) + ")!");
    return current_working_dir;
}


std::vector<std::string> SplitPathComponents(const std::string &path) {
    std::vector<std::string> components;
    if (not path.empty() and path[0] == '/')
        components.emplace_back("/");

    std::vector<std::string> parts;
    StringUtil::Split(path, '/', &parts, /* suppress_empty_components = */ true);
    for (const auto &part : parts) {
        if (part != ".")
            components.emplace_back(part);
    }

    return components;
}


bool StripPathPrefix(const std::string &path, const std::string &prefix, std::string * const remainder) {
    const auto path_components(SplitPathComponents(path));
    const auto prefix_components(SplitPathComponents(prefix));
    if (prefix_components.size() > path_components.size())
        return false;

    auto path_component(path_components.cbegin());
    for (const auto &prefix_component : prefix_components) {
        if (*path_component != prefix_component)
            return false;
        ++path_component;
    }

    remainder->clear();
    for (/* Intentionally empty! */; path_component != path_components.cend(); ++path_component) {
        if (not remainder->empty())
            *remainder += '/';
        *remainder += *path_component;
    }

    return true;
}


bool MakeDirectory(const std::string &path, const bool recursive, const mode_t mode) {
    // In NON-recursive mode we make a single attempt to create the directory:
    if (not recursive) {
        errno = 0;
        if (::mkdir(path.c_str(), mode) == 0)
            return true;
        const bool dir_exists(errno == EEXIST and IsDirectory(path));
        if (dir_exists)
            errno = 0;
        return dir_exists;
    }

    std::vector<std::string> path_components;
    StringUtil::Split(path, '/', &path_components, /* suppress_empty_components = */ true);

    std::string path_so_far(path[0] == '/' ? "/" : "");
    for (const auto &path_component : path_components) {
        path_so_far += path_component;
        path_so_far += '/';
        errno = 0;
        if (::mkdir(path_so_far.c_str(), mode) == -1 and errno != EEXIST)
            return false;
        if (errno == EEXIST and not IsDirectory(path_so_far))
            return false;
    }

    errno = 0;
    return true;
}


void MakeDirectoryOrDie(const std::string &path, const bool recursive, const mode_t mode) {
    if (not MakeDirectory(path, recursive, mode))
        LOG_ERROR("failed to create directory \"" + path + "\"!");
}


bool RemoveDirectory(const std::string &dir_name) {
    try {
        std::vector<std::string> subdirectories, other_entries;
        for (const auto &entry : Directory(dir_name)) {
            if (entry.getType() == DT_DIR)
                subdirectories.emplace_back(entry.getFullName());
            else
                other_entries.emplace_back(entry.getFullName());
        }

        for (const auto &subdirectory : subdirectories) {
            if (unlikely(not RemoveDirectory(subdirectory)))
                return false;
        }

        for (const auto &other_entry : other_entries) {
            if (unlikely(::unlink(other_entry.c_str()) != 0 and errno != ENOENT))
                return false;
        }
    } catch (const std::runtime_error &x) {
        LOG_DEBUG(x.what());
        return false;
    }

    errno = 0;
    return ::rmdir(dir_name.c_str()) == 0;
}


void CreateSymlinkOrDie(const std::string &target_filename, const std::string &link_filename) {
    if (unlikely(::symlink(target_filename.c_str(), link_filename.c_str()) != 0))
        LOG_ERROR("failed to create symlink \"" + link_filename + "\" => \"" + target_filename + "\"!");
}


std::unique_ptr<File> OpenOutputFileOrDie(const std::string &filename) {
    std::unique_ptr<File> file(new File(filename, "w"));
    if (file->fail())
        LOG_ERROR("can't open \"" + filename + "\" for writing!");

    return file;
}


} // namespace FileUtil
