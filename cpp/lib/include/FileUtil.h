/** \file    FileUtil.h
 *  \brief   Declaration of file-related utility functions.
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


#include <memory>
#include <string>
#include <vector>
#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include "File.h"


namespace FileUtil {


/** \class Directory
 *  \brief Lists the entries of a single directory, w/o "." and "..".
 *  \note  Entries are lstat(2)'ed, so symlinks are reported as DT_LNK and never as their targets' types.  Entries that
 *         vanish between readdir(3) and lstat(2) are skipped, entries that can't be lstat'ed for other reasons are
 *         reported as DT_UNKNOWN.
 */
class Directory {
    const std::string path_;

public:
    class const_iterator; // Forward declaration.
    class Entry {
        friend class Directory::const_iterator;
        std::string dirname_;
        std::string name_;
        struct stat statbuf_;

    public:
        Entry(const Entry &other) = default;

        /** \return the name of the entry w/o the directory path. */
        inline const std::string &getName() const { return name_; }

        /** \return the name of the entry w/ the directory path. */
        inline std::string getFullName() const {
            return (not dirname_.empty() and dirname_.back() == '/') ? dirname_ + name_ : dirname_ + "/" + name_;
        }

        // \return One of DT_BLK(block device), DT_CHR(character device), DT_DIR(directory), DT_FIFO(named pipe),
        //         DT_LNK(symlink), DT_REG(regular file), DT_SOCK(UNIX domain socket), or DT_UNKNOWN(unknown type).
        unsigned char getType() const { return IFTODT(statbuf_.st_mode); /* Convert from st_mode to d_type. */ }

    private:
        explicit Entry(const std::string &dirname): dirname_(dirname) { }
    };

public:
    class const_iterator {
        friend class Directory;
        DIR *dir_handle_;
        Entry entry_;

    public:
        const_iterator(const const_iterator &rhs) = delete;
        const_iterator(const_iterator &&rhs): dir_handle_(rhs.dir_handle_), entry_(rhs.entry_) { rhs.dir_handle_ = nullptr; }
        ~const_iterator();

        const Entry &operator*() const;
        const Entry *operator->() const { return &operator*(); }
        void operator++();
        bool operator==(const const_iterator &rhs) const;
        bool operator!=(const const_iterator &rhs) const { return not operator==(rhs); }

    private:
        explicit const_iterator(const std::string &path, const bool end = false);
        void advance();
    };

public:
    /** \brief Initialises a new instance of Directory.
     *  \param path   The path to the directory we want to list.
     *  \note  begin() throws a std::runtime_error if "path" can't be opened.
     */
    explicit Directory(const std::string &path): path_(path) { }

    inline const_iterator begin() const { return const_iterator(path_); }
    inline const_iterator end() const { return const_iterator(path_, /* end = */ true); }
};


/** \class AutoTempDirectory
 *  \brief Creates a temp directory and removes it when going out of scope.
 */
class AutoTempDirectory {
    std::string path_;
    bool cleanup_if_exception_is_active_;
    bool remove_when_out_of_scope_;

public:
    explicit AutoTempDirectory(const std::string &path_prefix = "/tmp/ATD", const bool cleanup_if_exception_is_active = true,
                               const bool remove_when_out_of_scope = true);
    AutoTempDirectory(const AutoTempDirectory &rhs) = delete;
    ~AutoTempDirectory();

    const std::string &getDirectoryPath() const { return path_; }
};


bool WriteString(const std::string &path, const std::string &data);
void WriteStringOrDie(const std::string &path, const std::string &data);
bool ReadString(const std::string &path, std::string * const data);
std::string ReadStringOrDie(const std::string &path);


/** \brief  Test whether a path exists.
 *  \note   Follows symlinks, so a dangling symlink does not exist.
 */
bool Exists(const std::string &path, std::string * const error_message = nullptr);


/** \return True if "path" exists and is a directory.  Follows symlinks. */
bool IsDirectory(const std::string &path);


/** \return True if "path" exists and is a regular file.  Follows symlinks. */
bool IsRegularFile(const std::string &path);


std::string GetCurrentWorkingDirectory();


/** \brief  Splits "path" into its components.
 *  \note   Empty and "." components are dropped, ".." components are kept verbatim.  An absolute path has "/" as its
 *          first component.
 */
std::vector<std::string> SplitPathComponents(const std::string &path);


/** \brief  Removes the leading directory "prefix" from "path", comparing whole path components.
 *  \param  remainder  If "path" lies below "prefix", the remaining components joined by slashes.
 *  \return True if "prefix" is a component-wise prefix of "path", else false.
 *  \note   No symlinks are resolved and ".." is not interpreted, i.e. "a/../b" is not considered to be below "b".
 */
bool StripPathPrefix(const std::string &path, const std::string &prefix, std::string * const remainder);


/** \brief  Create a directory.
 *  \param  path       The path to create.
 *  \param  recursive  If true, attempt to recursively create parent directoris too.
 *  \param  mode       The access permission for the directory/directories that will be created.
 *  \return True if the directory already existed or has been created else false.
 */
bool MakeDirectory(const std::string &path, const bool recursive = false, const mode_t mode = 0755);
void MakeDirectoryOrDie(const std::string &path, const bool recursive = false, const mode_t mode = 0755);


/** \brief  Recursively delete a directory.
 *  \param  dir_name  The path to the directory.
 *  \return True if the directory has been removed, else false.  In the latter case "errno" holds the reason.
 *  \note   Symlinks are removed but never followed.
 */
bool RemoveDirectory(const std::string &dir_name);


void CreateSymlinkOrDie(const std::string &target_filename, const std::string &link_filename);


/** \return A File opened for writing and truncated.  Calls LOG_ERROR if the file can't be created. */
std::unique_ptr<File> OpenOutputFileOrDie(const std::string &filename);


} // namespace FileUtil
