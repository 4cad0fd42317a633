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
 * @file AT_Common.h
 * @brief Common definitions and compiler attributes shared by all ArduTune libraries
 *
 * @details Every library includes this header first. It carries the attribute
 *          macros used to mark functions whose status result must be checked,
 *          functions that never return and printf-style functions, plus a few
 *          small helpers (ARRAY_SIZE, unused-variable suppression).
 */
#pragma once

#include <stdint.h>
#include <stddef.h>
#include <string>

/// Mark a function whose return value carries a status that must be checked
#define WARN_IF_UNUSED __attribute__ ((warn_unused_result))

/// Mark a function that never returns to its caller
#define NORETURN __attribute__ ((noreturn))

/// Enable printf-style argument checking for a format string at position a
#define FMT_PRINTF(a,b) __attribute__((format(printf, a, b)))

/// Number of elements in a statically sized array
#define ARRAY_SIZE(_arr) (sizeof(_arr) / sizeof(_arr[0]))

/// Disallow copying of singletons and owners of large buffers
#define CLASS_NO_COPY(c) c(const c &other) = delete; c &operator=(const c&) = delete

/**
 * @brief Control axis index used throughout the analysis libraries
 *
 * @details Gyro x/y/z map onto roll/pitch/yaw respectively.
 */
enum class AT_Axis : uint8_t {
    ROLL  = 0,
    PITCH = 1,
    YAW   = 2,
};

/// number of control axes analysed per log
static const uint8_t AT_NUM_AXES = 3;

/// human readable axis name, "Roll", "Pitch" or "Yaw"
const char *at_axis_name(AT_Axis axis);

/// lower case axis name as used in firmware console commands
const char *at_axis_cli_name(AT_Axis axis);

/// printf into a std::string, used to build command and note text
std::string at_sprintf(const char *fmt, ...) FMT_PRINTF(1, 2);
