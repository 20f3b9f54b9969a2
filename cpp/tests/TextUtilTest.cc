/** \brief Test cases for the UTF-8 and UTF-16 validators in TextUtil.
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
#define BOOST_TEST_MODULE TextUtil
#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>
#include <string>
#include "TextUtil.h"


BOOST_AUTO_TEST_CASE(ValidUTF8) {
    BOOST_CHECK(TextUtil::IsValidUTF8(""));
    BOOST_CHECK(TextUtil::IsValidUTF8("plain ASCII\n"));
    BOOST_CHECK(TextUtil::IsValidUTF8("T\xC3\xBC" "bingen"));
    BOOST_CHECK(TextUtil::IsValidUTF8("\xE2\x82\xAC")); // Euro sign
    BOOST_CHECK(TextUtil::IsValidUTF8("\xF0\x9F\x98\x80")); // U+1F600
    BOOST_CHECK(TextUtil::IsValidUTF8(TextUtil::UTF8_BOM + "text"));
    BOOST_CHECK(TextUtil::IsValidUTF8(std::string("a\0b", 3)));
}


BOOST_AUTO_TEST_CASE(InvalidUTF8) {
    BOOST_CHECK(not TextUtil::IsValidUTF8("\xFF"));
    BOOST_CHECK(not TextUtil::IsValidUTF8("abc\xC3"));            // truncated
    BOOST_CHECK(not TextUtil::IsValidUTF8("\xC3("));              // bad continuation byte
    BOOST_CHECK(not TextUtil::IsValidUTF8("\xC0\xAF"));           // overlong
    BOOST_CHECK(not TextUtil::IsValidUTF8("\xE0\x80\xAF"));       // overlong
    BOOST_CHECK(not TextUtil::IsValidUTF8("\xED\xA0\x80"));       // encoded surrogate
    BOOST_CHECK(not TextUtil::IsValidUTF8("\xF4\x90\x80\x80"));   // above U+10FFFF
    BOOST_CHECK(not TextUtil::IsValidUTF8("latin-1 \xE4 umlaut"));
}


BOOST_AUTO_TEST_CASE(ValidUTF16) {
    using TextUtil::ByteOrder;
    BOOST_CHECK(TextUtil::IsValidUTF16("", ByteOrder::LITTLE_ENDIAN_ORDER));
    BOOST_CHECK(TextUtil::IsValidUTF16(TextUtil::UTF16LE_BOM + std::string("h\0i\0", 4), ByteOrder::LITTLE_ENDIAN_ORDER));
    BOOST_CHECK(TextUtil::IsValidUTF16(TextUtil::UTF16BE_BOM + std::string("\0h\0i", 4), ByteOrder::BIG_ENDIAN_ORDER));
    BOOST_CHECK(TextUtil::IsValidUTF16(std::string("\x3D\xD8\x00\xDE", 4), ByteOrder::LITTLE_ENDIAN_ORDER)); // U+1F600
    BOOST_CHECK(TextUtil::IsValidUTF16(std::string("\xD8\x3D\xDE\x00", 4), ByteOrder::BIG_ENDIAN_ORDER));    // U+1F600
}


BOOST_AUTO_TEST_CASE(InvalidUTF16) {
    using TextUtil::ByteOrder;
    BOOST_CHECK(not TextUtil::IsValidUTF16(std::string("h\0i", 3), ByteOrder::LITTLE_ENDIAN_ORDER));
    BOOST_CHECK(not TextUtil::IsValidUTF16("\x3D\xD8", ByteOrder::LITTLE_ENDIAN_ORDER));          // lone high surrogate
    BOOST_CHECK(not TextUtil::IsValidUTF16(std::string("\x00\xDE", 2), ByteOrder::LITTLE_ENDIAN_ORDER)); // lone low surrogate
    BOOST_CHECK(not TextUtil::IsValidUTF16(std::string("\x3D\xD8h\0", 4), ByteOrder::LITTLE_ENDIAN_ORDER));
    BOOST_CHECK(not TextUtil::IsValidUTF16("\xD8\x3D\xD8\x3D", ByteOrder::BIG_ENDIAN_ORDER));
}
