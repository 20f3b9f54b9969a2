/** \file    MediaTypeUtil.cc
 *  \brief   Implementation of Media Type utility functions.
 *
 *  \copyright 2016-2026 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include "MediaTypeUtil.h"
#include <algorithm>
#include <stdexcept>
#include <cctype>
#include <cstring>
#include "Compiler.h"


namespace MediaTypeUtil {


MagicCookie::MagicCookie(const int flags) {
    cookie_ = ::magic_open(flags);
    if (unlikely(cookie_ == nullptr))
        throw std::runtime_error("in MediaTypeUtil::MagicCookie::MagicCookie: could not open libmagic!");

    // Load the default "magic" definitions file:
    if (unlikely(::magic_load(cookie_, nullptr /* use default magic file */) != 0)) {
        const std::string error_message(::magic_error(cookie_));
        ::magic_close(cookie_);
        throw std::runtime_error("in MediaTypeUtil::MagicCookie::MagicCookie: could not load libmagic (" + error_message + ").");
    }
}


std::string MagicCookie::classify(const std::string &buffer) const {
    const char *magic_result(::magic_buffer(cookie_, buffer.data(), buffer.length()));
    if (unlikely(magic_result == nullptr))
        throw std::runtime_error("in MediaTypeUtil::MagicCookie::classify: error in libmagic (" + std::string(::magic_error(cookie_))
                                 + ").");

    // Attempt to remove possible leading junk (no idea why libmagic behaves in this manner every now and then):
    if (std::strncmp(magic_result, "\\012- ", 6) == 0)
        magic_result += 6;

    return magic_result;
}


std::string GetMediaEncoding(const MagicCookie &encoding_cookie, const std::string &document) {
    std::string encoding(encoding_cookie.classify(document));
    std::transform(encoding.begin(), encoding.end(), encoding.begin(), [](unsigned char ch) { return std::tolower(ch); });
    return encoding;
}


} // namespace MediaTypeUtil
