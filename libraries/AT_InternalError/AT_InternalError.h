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

/**
 * @file AT_InternalError.h
 * @brief Record of programming errors detected at runtime
 *
 * @details Analysis code reports recoverable input problems through status
 *          results. Conditions that can only arise from a bug (an enumerator
 *          outside its declared set, a size invariant broken between two
 *          libraries) are reported here instead, through INTERNAL_ERROR().
 *
 *          Each error type is a bit; the tracker keeps the union of all bits
 *          seen, a total count and the source line of the most recent report.
 *
 *          With AT_INTERNALERROR_FATAL set (the default) an internal error is
 *          turned into AT::panic() so tests and development builds stop at the
 *          faulting line.
 */
#pragma once

#include <AT_Common/AT_Common.h>

#ifndef AT_INTERNALERROR_FATAL
#define AT_INTERNALERROR_FATAL 1
#endif

namespace AT {

/**
 * @brief Print a message to stderr and terminate
 *
 * @warning Never returns
 */
void panic(const char *errormsg, ...) FMT_PRINTF(1, 2) NORETURN;

}

class AT_InternalError {
public:
    AT_InternalError() {}

    CLASS_NO_COPY(AT_InternalError);

    static AT_InternalError *get_singleton();

    enum class error_t : uint16_t {
        param_table            = (1U <<  0),  ///< a parameter table entry is malformed
        logger_bad_format      = (1U <<  1),  ///< unknown format character in a trace record
        invalid_controller_type = (1U << 2),  ///< controller type outside the coefficient table
        __LAST__               = (1U <<  3),  ///< used only for sanity check
    };

    /**
     * @brief Record an internal error
     *
     * @param[in] e     error type
     * @param[in] line  source line of the report
     */
    void error(const AT_InternalError::error_t e, uint16_t line);

    /// convert an error type to a human readable name
    static const char *error_to_string(error_t e);

    uint32_t errors() const { return internal_errors; }
    uint32_t count() const { return total_error_count; }
    uint16_t last_line() const { return last_error_line; }

    /// forget all recorded errors; used between test cases
    void reset();

private:
    uint32_t internal_errors;
    uint32_t total_error_count;
    uint16_t last_error_line;

    static AT_InternalError *_singleton;
};

namespace AT {
    AT_InternalError &internalerror();
}

#define INTERNAL_ERROR(error_number) \
    AT::internalerror().error(error_number, __AT_LINE__)

#define __AT_LINE__ uint16_t(__LINE__)
