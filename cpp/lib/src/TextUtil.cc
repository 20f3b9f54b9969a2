/** \file    TextUtil.cc
 *  \brief   Implementation of text related utility functions.
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
#include "TextUtil.h"
#include "Compiler.h"
#include "util.h"


namespace TextUtil {


bool IsValidUTF8(const std::string &utf8_candidate) {
    for (std::string::const_iterator ch(utf8_candidate.begin()); ch != utf8_candidate.end(); ++ch) {
        const unsigned char uch(static_cast<unsigned char>(*ch));
        unsigned sequence_length;
        uint32_t code_point;
        if ((uch & 0b10000000) == 0b00000000)
            continue;
        else if ((uch & 0b11100000) == 0b11000000)
            sequence_length = 1, code_point = uch & 0b00011111;
        else if ((uch & 0b11110000) == 0b11100000)
            sequence_length = 2, code_point = uch & 0b00001111;
        else if ((uch & 0b11111000) == 0b11110000)
            sequence_length = 3, code_point = uch & 0b00000111;
        else {
            LOG_DEBUG("bad sequence start character at offset " + std::to_string(ch - utf8_candidate.begin()) + "!");
            return false;
        }

        for (unsigned i(0); i < sequence_length; ++i) {
            ++ch;
            if (unlikely(ch == utf8_candidate.end())) {
                LOG_DEBUG("premature string end in the middle of a UTF8 byte sequence!");
                return false;
            }
            if (unlikely((static_cast<unsigned char>(*ch) & 0b11000000) != 0b10000000)) {
                LOG_DEBUG("unexpected upper-bit pattern in a UTF8 sequence at offset " + std::to_string(ch - utf8_candidate.begin())
                          + "!");
                return false;
            }
            code_point = (code_point << 6u) | (static_cast<unsigned char>(*ch) & 0b00111111);
        }

        static const uint32_t MIN_CODE_POINTS[] = { 0, 0x80u, 0x800u, 0x10000u };
        if (unlikely(code_point < MIN_CODE_POINTS[sequence_length])) {
            LOG_DEBUG("overlong UTF8 sequence!");
            return false;
        }
        if (unlikely((code_point >= 0xD800u and code_point <= 0xDFFFu) or code_point > 0x10FFFFu)) {
            LOG_DEBUG("UTF8 sequence encodes an invalid code point!");
            return false;
        }
    }

    return true;
}


bool IsValidUTF16(const std::string &utf16_candidate, const ByteOrder byte_order) {
    if (unlikely(utf16_candidate.length() % 2 != 0)) {
        LOG_DEBUG("odd number of bytes in a UTF16 string!");
        return false;
    }

    bool expecting_second_half(false);
    for (std::string::size_type i(0); i < utf16_candidate.length(); i += 2) {
        const uint16_t first_byte(static_cast<unsigned char>(utf16_candidate[i]));
        const uint16_t second_byte(static_cast<unsigned char>(utf16_candidate[i + 1]));
        const uint16_t code_unit(byte_order == ByteOrder::LITTLE_ENDIAN_ORDER ? (second_byte << 8u) | first_byte
                                                                              : (first_byte << 8u) | second_byte);
        if (expecting_second_half) {
            if (unlikely(not IsSecondHalfOfSurrogatePair(code_unit))) {
                LOG_DEBUG("unpaired first half of a UTF16 surrogate pair!");
                return false;
            }
            expecting_second_half = false;
        } else if (IsFirstHalfOfSurrogatePair(code_unit))
            expecting_second_half = true;
        else if (unlikely(not IsValidSingleUTF16Char(code_unit))) {
            LOG_DEBUG("unpaired second half of a UTF16 surrogate pair!");
            return false;
        }
    }

    if (unlikely(expecting_second_half)) {
        LOG_DEBUG("UTF16 string ends in the middle of a surrogate pair!");
        return false;
    }

    return true;
}


} // namespace TextUtil
