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
 * @file AT_Logger.h
 * @brief Structured trace of one analysis run
 *
 * @details Every analysis step records what it did through this class. Two
 *          kinds of entries are kept:
 *
 *          - records: named rows of numeric fields, written with the same
 *            name/labels/format convention the flight-side dataflash logger
 *            uses, e.g.
 *            @code
 *            logger.Write("SPEC", "N,Fs,Res", "Hff", n, fs, res);
 *            @endcode
 *          - text messages: free-form lines tagged with a severity
 *
 *          Format characters accepted by Write():
 *          - b int8_t, B uint8_t
 *          - h int16_t, H uint16_t
 *          - i int32_t, I uint32_t
 *          - q int64_t, Q uint64_t
 *          - f float, d double
 *
 *          All fields are stored as float. Every entry is kept. When a
 *          console stream is set, records and text messages at or above the
 *          configured severity are echoed to it.
 */
#pragma once

#include <stdarg.h>
#include <stdio.h>
#include <string>
#include <vector>

#include <AT_Common/AT_Common.h>

class AT_Logger {
public:
    /// severities follow the MAVLink MAV_SEVERITY numbering, lower is more severe
    enum class Severity : uint8_t {
        EMERGENCY = 0,
        ALERT     = 1,
        CRITICAL  = 2,
        ERROR     = 3,
        WARNING   = 4,
        NOTICE    = 5,
        INFO      = 6,
        DEBUG     = 7,
    };

    struct Record {
        std::string name;
        std::vector<std::string> labels;
        std::vector<float> values;

        /// value of the named field, NaN if the record has no such label
        float get(const char *label) const;
    };

    struct Message {
        Severity severity;
        std::string text;
    };

    AT_Logger() {}

    CLASS_NO_COPY(AT_Logger);

    /// echo only text messages whose severity is numerically at or below level
    void set_level(Severity level) { _level = level; }

    /// echo kept entries to stream, nullptr disables echo
    void set_console(FILE *stream) { _console = stream; }

    /**
     * @brief Append a structured record
     *
     * @param[in] name    record name, e.g. "SPEC"
     * @param[in] labels  comma separated field names, one per format character
     * @param[in] fmt     format characters, see file documentation
     */
    void Write(const char *name, const char *labels, const char *fmt, ...);
    void WriteV(const char *name, const char *labels, const char *fmt, va_list arg_list);

    void Write_Message(Severity severity, const char *message);
    void Write_MessageF(Severity severity, const char *fmt, ...) FMT_PRINTF(3, 4);

    const std::vector<Record> &records() const { return _records; }
    const std::vector<Message> &messages() const { return _messages; }

    /// most recent record with the given name, nullptr if none
    const Record *find(const char *name) const;

    /// number of records with the given name
    uint32_t count(const char *name) const;

    /// true if any message contains the given text
    bool have_message_containing(const char *text) const;

    void clear();

    static const char *severity_name(Severity severity);

private:
    Severity _level = Severity::INFO;
    FILE *_console = nullptr;

    std::vector<Record> _records;
    std::vector<Message> _messages;

    static std::vector<std::string> split_labels(const char *labels);
};

/// log a formatted text message through a logger that may be nullptr
#define AT_LOG_TEXT(logger, severity, fmt, ...) do {                    \
        if ((logger) != nullptr) {                                      \
            (logger)->Write_MessageF(severity, fmt, ##__VA_ARGS__);     \
        }                                                               \
    } while (0)
