/** \file    StringUtil.h
 *  \brief   Various string-related utility functions.
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
#include <cstring>
#include <strings.h>


namespace StringUtil {


const std::string WHITE_SPACE(" \t\n\v\f\r");


/** \brief   Remove all occurences of whitespace characters from either end of a string.
 *  \param   s  The string to trim.
 *  \return  The trimmed string.
 */
inline std::string TrimWhite(const std::string &s) {
    const auto first(s.find_first_not_of(WHITE_SPACE));
    if (first == std::string::npos)
        return "";
    const auto last(s.find_last_not_of(WHITE_SPACE));
    return s.substr(first, last - first + 1);
}


/** \brief   Does the given string start with the suggested prefix?
 *  \param   s            The string to test.
 *  \param   prefix       The prefix to test for.
 *  \param   ignore_case  If true, the match will be case-insensitive.
 *  \return  True if the string "s" equals or starts with the prefix "prefix."
 */
inline bool StartsWith(const std::string &s, const std::string &prefix, const bool ignore_case = false) {
    return prefix.empty()
           or (s.length() >= prefix.length()
               and (ignore_case ? (::strncasecmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)
                                : (std::strncmp(s.c_str(), prefix.c_str(), prefix.length()) == 0)));
}


/** \brief  Split a string around a delimiter character.
 *  \param  s                          The string to split.
 *  \param  field_separator            The delimiter character.
 *  \param  container                  A back insertion sequence that will hold the parts.
 *  \param  suppress_empty_components  If true, empty parts are dropped.
 *  \return The number of extracted parts.
 */
template <typename InsertableContainer>
unsigned Split(const std::string &s, const char field_separator, InsertableContainer * const container,
               const bool suppress_empty_components = true)
{
    container->clear();
    if (s.empty())
        return 0;

    unsigned count(0);
    std::string::size_type start(0);
    for (;;) {
        const auto separator_pos(s.find(field_separator, start));
        const std::string component(s.substr(start, separator_pos == std::string::npos ? std::string::npos : separator_pos - start));
        if (not component.empty() or not suppress_empty_components) {
            container->insert(container->end(), component);
            ++count;
        }
        if (separator_pos == std::string::npos)
            return count;
        start = separator_pos + 1;
    }
}


} // namespace StringUtil
