/*
   This program is free software: you can redistribute it and/or modify
   it under the terms of the GNU General Public License as published by
   the Free Software Foundation, either version 3 of the License, or
   (at your option) any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU General Public License for more details.

   You should have received a copy of the GNU General Public License
   along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "AT_Common.h"

#include <stdarg.h>
#include <stdio.h>

const char *at_axis_name(AT_Axis axis)
{
    switch (axis) {
    case AT_Axis::ROLL:
        return "Roll";
    case AT_Axis::PITCH:
        return "Pitch";
    case AT_Axis::YAW:
        return "Yaw";
    }
    return "?";
}

const char *at_axis_cli_name(AT_Axis axis)
{
    switch (axis) {
    case AT_Axis::ROLL:
        return "roll";
    case AT_Axis::PITCH:
        return "pitch";
    case AT_Axis::YAW:
        return "yaw";
    }
    return "?";
}

std::string at_sprintf(const char *fmt, ...)
{
    char buf[256];
    va_list ap;
    va_start(ap, fmt);
    const int n = vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    if (n < 0) {
        return std::string();
    }
    if (size_t(n) < sizeof(buf)) {
        return std::string(buf, size_t(n));
    }

    // longer than the stack buffer, format again into the string itself
    std::string ret(size_t(n) + 1, '\0');
    va_start(ap, fmt);
    vsnprintf(&ret[0], ret.size(), fmt, ap);
    va_end(ap);
    ret.resize(size_t(n));
    return ret;
}
