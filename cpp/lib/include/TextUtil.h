/** \file    TextUtil.h
 *  \brief   Declarations of text related utility functions.
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


#include <string>
#include <cstdint>


namespace TextUtil {


const std::string UTF8_BOM("\xEF\xBB\xBF");
const std::string UTF16LE_BOM("\xFF\xFE");
const std::string UTF16BE_BOM("\xFE\xFF");
const std::string UTF32LE_BOM("\xFF\xFE\x00\x00", 4);
const std::string UTF32BE_BOM("\x00\x00\xFE\xFF", 4);


enum class ByteOrder { LITTLE_ENDIAN_ORDER, BIG_ENDIAN_ORDER };


/** \return True if "u1" is a valid first UTF-16 code unit in a surrogate pair. */
inline bool IsFirstHalfOfSurrogatePair(const uint16_t u1) {
    return (u1 & 0xFC00u) == 0xD800u;
}


/** \return True if "u2" is a valid second UTF-16 code unit in a surrogate pair. */
inline bool IsSecondHalfOfSurrogatePair(const uint16_t u2) {
    return (u2 & 0xFC00u) == 0xDC00u;
}


/** \return True if "u" is a valid single UTF-16 character, i.e. not part of a surrogate pair. */
inline bool IsValidSingleUTF16Char(const uint16_t u) {
    return (u <= 0xD7FFu) or (0xE000u <= u);
}


/** \brief Strict UTF-8 validation.
 *  \note  Rejects overlong encodings, encoded surrogates, code points above U+10FFFF and truncated sequences.
 */
bool IsValidUTF8(const std::string &utf8_candidate);


/** \brief Strict UTF-16 validation.
 *  \note  "utf16_candidate" must consist of an even number of bytes and every surrogate must be correctly paired.  A
 *         leading byte-order mark is treated like any other character.
 */
bool IsValidUTF16(const std::string &utf16_candidate, const ByteOrder byte_order);


} // namespace TextUtil
