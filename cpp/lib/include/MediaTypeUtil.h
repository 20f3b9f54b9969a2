/** \file    MediaTypeUtil.h
 *  \brief   Declarations of MIME/media type utility functions.
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
#pragma once


#include <string>
#include <magic.h>


/** \namespace  MediaTypeUtil
 *  \brief      Utility functions for determining the MIME media type and character encoding of a resource.
 */
namespace MediaTypeUtil {


/** \class MagicCookie
 *  \brief Owns a libmagic handle w/ the default "magic" definitions loaded.
 *  \note  Loading the definitions is expensive, so keep an instance around if you have to classify many buffers.
 */
class MagicCookie {
    magic_t cookie_;

public:
    /** \param flags  Any combination of libmagic's MAGIC_* flags, e.g. MAGIC_MIME_TYPE or MAGIC_MIME_ENCODING.
     *  \throws std::runtime_error if libmagic can't be initialised.
     */
    explicit MagicCookie(const int flags);
    MagicCookie(const MagicCookie &rhs) = delete;
    MagicCookie &operator=(const MagicCookie &rhs) = delete;
    ~MagicCookie() { ::magic_close(cookie_); }

    /** \return What libmagic has to say about "buffer", w/ possible leading junk removed.
     *  \throws std::runtime_error if libmagic fails.
     */
    std::string classify(const std::string &buffer) const;
};


/** \brief  Get the character encoding of a document as determined by libmagic.
 *  \param  encoding_cookie  A cookie opened w/ MAGIC_MIME_ENCODING.
 *  \param  document         The document to analyse.
 *  \return The lowercase encoding name, e.g. "us-ascii", "utf-8", "utf-16le", "iso-8859-1" or "binary".
 *  \throws std::runtime_error if libmagic fails.
 */
std::string GetMediaEncoding(const MagicCookie &encoding_cookie, const std::string &document);


} // namespace MediaTypeUtil
