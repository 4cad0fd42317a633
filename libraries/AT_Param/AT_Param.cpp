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

#include "AT_Param.h"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <limits>

#include <AT_InternalError/AT_InternalError.h>

template <typename T>
static bool set_int(void *ptr, float value)
{
    const double r = std::round(double(value));
    const double lo = double(std::numeric_limits<T>::min());
    const double hi = double(std::numeric_limits<T>::max());
    *static_cast<T *>(ptr) = T(r < lo ? lo : (r > hi ? hi : r));
    return true;
}

bool AT_Param::set_value(at_var_type type, void *ptr, float value)
{
    if (!std::isfinite(value)) {
        return false;
    }
    switch (type) {
    case AT_PARAM_INT8:
        return set_int<int8_t>(ptr, value);
    case AT_PARAM_INT16:
        return set_int<int16_t>(ptr, value);
    case AT_PARAM_INT32:
        return set_int<int32_t>(ptr, value);
    case AT_PARAM_FLOAT:
        *static_cast<float *>(ptr) = value;
        return true;
    case AT_PARAM_NONE:
        break;
    }
    INTERNAL_ERROR(AT_InternalError::error_t::param_table);
    return false;
}

float AT_Param::get_value(at_var_type type, const void *ptr)
{
    switch (type) {
    case AT_PARAM_INT8:
        return *static_cast<const int8_t *>(ptr);
    case AT_PARAM_INT16:
        return *static_cast<const int16_t *>(ptr);
    case AT_PARAM_INT32:
        return float(*static_cast<const int32_t *>(ptr));
    case AT_PARAM_FLOAT:
        return *static_cast<const float *>(ptr);
    case AT_PARAM_NONE:
        break;
    }
    INTERNAL_ERROR(AT_InternalError::error_t::param_table);
    return 0.0f;
}

void AT_Param::setup_object_defaults(const void *object, const GroupInfo *group_info)
{
    uintptr_t base = uintptr_t(object);
    for (uint8_t i = 0; !is_group_end(group_info[i]); i++) {
        const GroupInfo &info = group_info[i];
        void *ptr = (void *)(base + info.offset);
        if (!set_value(info.type, ptr, info.def_value)) {
            INTERNAL_ERROR(AT_InternalError::error_t::param_table);
        }
    }
}

void AT_ParamTable::add_group(const char *prefix, void *object, const AT_Param::GroupInfo *group_info)
{
    for (uint8_t i = 0; !AT_Param::is_group_end(group_info[i]); i++) {
        char fullname[AT_MAX_NAME_SIZE+1];
        const int len = snprintf(fullname, sizeof(fullname), "%s%s", prefix, group_info[i].name);
        Location loc;
        if (len < 0 || len > AT_MAX_NAME_SIZE || find(fullname, loc)) {
            INTERNAL_ERROR(AT_InternalError::error_t::param_table);
            return;
        }
    }
    _groups.push_back(AT_Param::Info{prefix, object, group_info});
}

void AT_ParamTable::setup_defaults()
{
    for (const AT_Param::Info &g : _groups) {
        AT_Param::setup_object_defaults(g.object, g.group_info);
    }
}

bool AT_ParamTable::find(const char *name, Location &loc) const
{
    for (const AT_Param::Info &g : _groups) {
        const size_t plen = strlen(g.prefix);
        if (strncmp(name, g.prefix, plen) != 0) {
            continue;
        }
        const char *suffix = name + plen;
        for (uint8_t i = 0; !AT_Param::is_group_end(g.group_info[i]); i++) {
            const AT_Param::GroupInfo &info = g.group_info[i];
            if (strcmp(suffix, info.name) == 0) {
                loc.type = info.type;
                loc.ptr = (void *)(uintptr_t(g.object) + info.offset);
                return true;
            }
        }
    }
    return false;
}

bool AT_ParamTable::set_by_name(const char *name, float value)
{
    Location loc;
    if (!find(name, loc)) {
        return false;
    }
    return AT_Param::set_value(loc.type, loc.ptr, value);
}

bool AT_ParamTable::get_by_name(const char *name, float &value) const
{
    Location loc;
    if (!find(name, loc)) {
        return false;
    }
    value = AT_Param::get_value(loc.type, loc.ptr);
    return true;
}

uint16_t AT_ParamTable::count() const
{
    uint16_t n = 0;
    for (const AT_Param::Info &g : _groups) {
        for (uint8_t i = 0; !AT_Param::is_group_end(g.group_info[i]); i++) {
            n++;
        }
    }
    return n;
}

bool AT_ParamTable::apply_defaults_line(const char *line, bool &was_blank)
{
    was_blank = false;

    char buf[128];
    strncpy(buf, line, sizeof(buf)-1);
    buf[sizeof(buf)-1] = 0;

    char *comment = strchr(buf, '#');
    if (comment != nullptr) {
        *comment = 0;
    }

    char *saveptr = nullptr;
    const char *pname = strtok_r(buf, ", \t\r\n", &saveptr);
    if (pname == nullptr) {
        was_blank = true;
        return false;
    }
    const char *value_s = strtok_r(nullptr, ", \t\r\n", &saveptr);
    if (value_s == nullptr) {
        return false;
    }
    char *endptr = nullptr;
    const float value = strtof(value_s, &endptr);
    if (endptr == value_s || *endptr != 0) {
        return false;
    }
    // trailing tokens mean the line is not a NAME VALUE pair
    if (strtok_r(nullptr, ", \t\r\n", &saveptr) != nullptr) {
        return false;
    }
    return set_by_name(pname, value);
}

bool AT_ParamTable::load_defaults_file(const char *filename, uint16_t &num_loaded, uint16_t &num_ignored)
{
    num_loaded = 0;
    num_ignored = 0;

    FILE *f = fopen(filename, "r");
    if (f == nullptr) {
        return false;
    }
    char line[128];
    while (fgets(line, sizeof(line), f) != nullptr) {
        bool was_blank;
        if (apply_defaults_line(line, was_blank)) {
            num_loaded++;
        } else if (!was_blank) {
            num_ignored++;
        }
    }
    fclose(f);
    return true;
}

void AT_ParamTable::show_all(FILE *stream) const
{
    for (const AT_Param::Info &g : _groups) {
        uintptr_t base = uintptr_t(g.object);
        for (uint8_t i = 0; !AT_Param::is_group_end(g.group_info[i]); i++) {
            const AT_Param::GroupInfo &info = g.group_info[i];
            const float v = AT_Param::get_value(info.type, (const void *)(base + info.offset));
            fprintf(stream, "%s%s %g\n", g.prefix, info.name, double(v));
        }
    }
}
