/** \file    MiscUtil.h
 *  \brief   Declarations of miscellaneous utility functions.
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


namespace MiscUtil {


/** \return The value of the environment variable "name" or the empty string if it is not set. */
std::string SafeGetEnv(const char * const name);
inline std::string SafeGetEnv(const std::string &name) {
    return SafeGetEnv(name.c_str());
}


} // namespace MiscUtil
