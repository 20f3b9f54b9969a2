/** \file    TimeUtil.cc
 *  \brief   Implementation of time-related utility functions.
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
#include "TimeUtil.h"
#include <stdexcept>
#include "Compiler.h"


namespace TimeUtil {


// The logger formats its time stamps with these functions, so we must not use LOG_ERROR in here.
std::string TimeTToString(const time_t &the_time, const std::string &format, const TimeZone time_zone) {
    struct tm tm;
    if (unlikely((time_zone == LOCAL ? ::localtime_r(&the_time, &tm) : ::gmtime_r(&the_time, &tm)) == nullptr))
        throw std::runtime_error("in TimeUtil::TimeTToString: time conversion error!");

    char time_buf[50 + 1];
    if (unlikely(std::strftime(time_buf, sizeof(time_buf), format.c_str(), &tm) == 0))
        throw std::runtime_error("in TimeUtil::TimeTToString: strftime(3) failed! (format: " + format + ")");
    return time_buf;
}


std::string GetCurrentDateAndTime(const std::string &format, const TimeZone time_zone) {
    time_t now;
    std::time(&now);
    return TimeTToString(now, format, time_zone);
}


} // namespace TimeUtil
