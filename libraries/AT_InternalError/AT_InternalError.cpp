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

#include "AT_InternalError.h"

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>

AT_InternalError *AT_InternalError::_singleton;

AT_InternalError *AT_InternalError::get_singleton()
{
    if (_singleton == nullptr) {
        static AT_InternalError instance;
        instance.reset();
        _singleton = &instance;
    }
    return _singleton;
}

void AT_InternalError::reset()
{
    internal_errors = 0;
    total_error_count = 0;
    last_error_line = 0;
}

void AT_InternalError::error(const AT_InternalError::error_t e, uint16_t line)
{
    internal_errors |= uint32_t(e);
    total_error_count++;
    last_error_line = line;

#if AT_INTERNALERROR_FATAL
    AT::panic("internal error %s at line %u", error_to_string(e), unsigned(line));
#else
    fprintf(stderr, "internal error %s at line %u\n", error_to_string(e), unsigned(line));
#endif
}

const char *AT_InternalError::error_to_string(error_t e)
{
    switch (e) {
    case error_t::param_table:
        return "param_table";
    case error_t::logger_bad_format:
        return "log_bad_fmt";
    case error_t::invalid_controller_type:
        return "bad_ctrl_type";
    case error_t::__LAST__:
        break;
    }
    return "unknown";
}

namespace AT {

AT_InternalError &internalerror()
{
    return *AT_InternalError::get_singleton();
}

void panic(const char *errormsg, ...)
{
    va_list ap;
    va_start(ap, errormsg);
    vfprintf(stderr, errormsg, ap);
    va_end(ap);
    fputc('\n', stderr);
    fflush(stderr);
    abort();
}

}
