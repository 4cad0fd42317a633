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

#include "AT_Logger.h"

#include <cmath>
#include <cstring>

#include <AT_InternalError/AT_InternalError.h>

float AT_Logger::Record::get(const char *label) const
{
    for (uint32_t i = 0; i < labels.size() && i < values.size(); i++) {
        if (labels[i] == label) {
            return values[i];
        }
    }
    return NAN;
}

std::vector<std::string> AT_Logger::split_labels(const char *labels)
{
    std::vector<std::string> ret;
    std::string current;
    for (const char *p = labels; *p != 0; p++) {
        if (*p == ',') {
            ret.push_back(current);
            current.clear();
        } else {
            current += *p;
        }
    }
    ret.push_back(current);
    return ret;
}

void AT_Logger::Write(const char *name, const char *labels, const char *fmt, ...)
{
    va_list arg_list;
    va_start(arg_list, fmt);
    WriteV(name, labels, fmt, arg_list);
    va_end(arg_list);
}

void AT_Logger::WriteV(const char *name, const char *labels, const char *fmt, va_list arg_list)
{
    Record rec;
    rec.name = name;
    rec.labels = split_labels(labels);

    if (rec.labels.size() != strlen(fmt)) {
        INTERNAL_ERROR(AT_InternalError::error_t::logger_bad_format);
        return;
    }

    for (const char *c = fmt; *c != 0; c++) {
        float v;
        switch (*c) {
        case 'b':
            v = int8_t(va_arg(arg_list, int));
            break;
        case 'B':
            v = uint8_t(va_arg(arg_list, unsigned int));
            break;
        case 'h':
            v = int16_t(va_arg(arg_list, int));
            break;
        case 'H':
            v = uint16_t(va_arg(arg_list, unsigned int));
            break;
        case 'i':
            v = va_arg(arg_list, int32_t);
            break;
        case 'I':
            v = va_arg(arg_list, uint32_t);
            break;
        case 'q':
            v = va_arg(arg_list, int64_t);
            break;
        case 'Q':
            v = va_arg(arg_list, uint64_t);
            break;
        case 'f':
        case 'd':
            // float is promoted to double through varargs
            v = float(va_arg(arg_list, double));
            break;
        default:
            INTERNAL_ERROR(AT_InternalError::error_t::logger_bad_format);
            return;
        }
        rec.values.push_back(v);
    }

    if (_console != nullptr) {
        fprintf(_console, "%s", rec.name.c_str());
        for (uint32_t i = 0; i < rec.values.size(); i++) {
            fprintf(_console, " %s=%g", rec.labels[i].c_str(), double(rec.values[i]));
        }
        fputc('\n', _console);
    }

    _records.push_back(std::move(rec));
}

void AT_Logger::Write_Message(Severity severity, const char *message)
{
    if (_console != nullptr && uint8_t(severity) <= uint8_t(_level)) {
        fprintf(_console, "%s: %s\n", severity_name(severity), message);
    }
    _messages.push_back(Message{severity, message});
}

void AT_Logger::Write_MessageF(Severity severity, const char *fmt, ...)
{
    char msg[256] {};
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(msg, sizeof(msg), fmt, ap);
    va_end(ap);
    Write_Message(severity, msg);
}

const AT_Logger::Record *AT_Logger::find(const char *name) const
{
    for (auto it = _records.rbegin(); it != _records.rend(); ++it) {
        if (it->name == name) {
            return &*it;
        }
    }
    return nullptr;
}

uint32_t AT_Logger::count(const char *name) const
{
    uint32_t n = 0;
    for (const Record &r : _records) {
        if (r.name == name) {
            n++;
        }
    }
    return n;
}

bool AT_Logger::have_message_containing(const char *text) const
{
    for (const Message &m : _messages) {
        if (m.text.find(text) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void AT_Logger::clear()
{
    _records.clear();
    _messages.clear();
}

const char *AT_Logger::severity_name(Severity severity)
{
    switch (severity) {
    case Severity::EMERGENCY:
        return "EMERGENCY";
    case Severity::ALERT:
        return "ALERT";
    case Severity::CRITICAL:
        return "CRITICAL";
    case Severity::ERROR:
        return "ERROR";
    case Severity::WARNING:
        return "WARNING";
    case Severity::NOTICE:
        return "NOTICE";
    case Severity::INFO:
        return "INFO";
    case Severity::DEBUG:
        return "DEBUG";
    }
    return "UNKNOWN";
}
