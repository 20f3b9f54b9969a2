/** \file    File.cc
 *  \brief   Implementation of class File.
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
#include "File.h"
#include <cerrno>
#include <cstring>
#include <unistd.h>


File::File(const std::string &filename, const std::string &mode, const ThrowOnOpenBehaviour throw_on_error_behaviour)
    : filename_(filename), file_(nullptr)
{
    if (mode == "w" or mode == "a")
        open_mode_ = WRITING;
    else if (mode == "r")
        open_mode_ = READING;
    else if (mode == "r+")
        open_mode_ = READING_AND_WRITING;
    else {
        if (throw_on_error_behaviour == THROW_ON_ERROR)
            throw std::runtime_error("in File::File: open mode \"" + mode + "\" not supported!");
        errno = EINVAL;
        return;
    }

    errno = 0;
    file_ = std::fopen(filename.c_str(), mode.c_str());
    if (file_ == nullptr and throw_on_error_behaviour == THROW_ON_ERROR)
        throw std::runtime_error("in File::File: could not open \"" + filename + "\" w/ mode \"" + mode + "\"! ("
                                 + std::string(std::strerror(errno)) + ")");
}


bool File::close() {
    if (file_ == nullptr) {
        errno = 0;
        return false;
    }

    const bool retval(std::fclose(file_) == 0);
    file_ = nullptr;
    return retval;
}


size_t File::read(void * const buf, const size_t buf_size) {
    if (unlikely(file_ == nullptr))
        throw std::runtime_error("in File::read: can't read from non-open file \"" + filename_ + "\"!");
    if (unlikely(open_mode_ == WRITING))
        throw std::runtime_error("in File::read: can't read from write-only file \"" + filename_ + "\"!");

    errno = 0;
    return std::fread(buf, 1, buf_size, file_);
}


size_t File::write(const void * const buf, const size_t buf_size) {
    if (unlikely(file_ == nullptr))
        throw std::runtime_error("in File::write: can't write to non-open file \"" + filename_ + "\"!");
    if (unlikely(open_mode_ == READING))
        throw std::runtime_error("in File::write: can't write to read-only file \"" + filename_ + "\"!");

    errno = 0;
    return std::fwrite(buf, 1, buf_size, file_);
}
