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
 * @file AT_Param.h
 * @brief Typed, named parameters with table-declared defaults
 *
 * @details Each library that has user settable values declares them as
 *          AT_Int8/AT_Int16/AT_Int32/AT_Float members and publishes a static
 *          var_info[] table describing name, index, type, member offset and
 *          default:
 *
 *          @code
 *          const AT_Param::GroupInfo AT_Foo::var_info[] = {
 *              // @Param: RATE
 *              // @DisplayName: Rate
 *              // @Units: Hz
 *              AT_GROUPINFO("RATE", 1, AT_Foo, _rate, 400),
 *              AT_GROUPEND
 *          };
 *          @endcode
 *
 *          An AT_ParamTable joins groups under a prefix ("TUNE_", "VEH_") and
 *          resolves full names for get/set and for .parm defaults files.
 *
 *          Values live in RAM only; nothing is persisted.
 */
#pragma once

#include <stddef.h>
#include <stdio.h>
#include <string>
#include <type_traits>
#include <vector>

#include <AT_Common/AT_Common.h>

/// maximum length of a full parameter name, prefix included
#define AT_MAX_NAME_SIZE 16

enum at_var_type : uint8_t {
    AT_PARAM_NONE    = 0,
    AT_PARAM_INT8,
    AT_PARAM_INT16,
    AT_PARAM_INT32,
    AT_PARAM_FLOAT,
};

/// declare one parameter of a group table
#define AT_GROUPINFO(name, idx, clazz, element, def) \
    { name, idx, std::remove_reference<decltype(((clazz *)0)->element)>::type::vtype, \
      offsetof(clazz, element), float(def) }

/// terminate a group table
#define AT_GROUPEND { "", 0xFF, AT_PARAM_NONE, 0, 0.0f }

class AT_Param {
public:
    struct GroupInfo {
        const char *name;
        uint8_t idx;
        at_var_type type;
        ptrdiff_t offset;
        float def_value;
    };

    /// a group table bound to one object under a name prefix
    struct Info {
        const char *prefix;
        void *object;
        const GroupInfo *group_info;
    };

    /// true if the entry is the AT_GROUPEND terminator
    static bool is_group_end(const GroupInfo &info) {
        return info.type == AT_PARAM_NONE;
    }

    /**
     * @brief Load every default from a group table into an object
     *
     * @details Called from library constructors, so a freshly constructed
     *          object always carries its documented defaults.
     */
    static void setup_object_defaults(const void *object, const GroupInfo *group_info);

    /**
     * @brief Store a float into a parameter of the given type
     *
     * @details Integer types round half away from zero and saturate at
     *          the type limits. Non-finite values are rejected.
     *
     * @return false if the value was rejected
     */
    static bool set_value(at_var_type type, void *ptr, float value) WARN_IF_UNUSED;

    /// read a parameter of the given type as float
    static float get_value(at_var_type type, const void *ptr);
};

template<typename T, at_var_type PT>
class AT_ParamT : public AT_Param
{
public:
    static const at_var_type vtype = PT;

    const T &get() const { return _value; }
    void set(const T &v) { _value = v; }

    float cast_to_float() const { return float(_value); }

    operator const T &() const { return _value; }

    AT_ParamT<T,PT> &operator=(const T &v) {
        _value = v;
        return *this;
    }

protected:
    T _value;
};

typedef AT_ParamT<int8_t,  AT_PARAM_INT8>  AT_Int8;
typedef AT_ParamT<int16_t, AT_PARAM_INT16> AT_Int16;
typedef AT_ParamT<int32_t, AT_PARAM_INT32> AT_Int32;
typedef AT_ParamT<float,   AT_PARAM_FLOAT> AT_Float;

/**
 * @brief Registry of parameter groups for one configuration
 */
class AT_ParamTable {
public:
    AT_ParamTable() {}

    CLASS_NO_COPY(AT_ParamTable);

    /**
     * @brief Register a group table under a prefix
     *
     * @details A table whose full names would exceed AT_MAX_NAME_SIZE or
     *          collide with an existing name is an internal error.
     */
    void add_group(const char *prefix, void *object, const AT_Param::GroupInfo *group_info);

    /// restore every registered parameter to its table default
    void setup_defaults();

    bool set_by_name(const char *name, float value) WARN_IF_UNUSED;
    bool get_by_name(const char *name, float &value) const WARN_IF_UNUSED;

    /// number of parameters across all groups
    uint16_t count() const;

    /**
     * @brief Apply a .parm defaults file
     *
     * @details Each line holds "NAME VALUE" or "NAME,VALUE". Text after '#'
     *          is a comment, blank lines are skipped. Lines naming an unknown
     *          parameter or holding an unparseable value are counted in
     *          num_ignored and otherwise skipped.
     *
     * @return false if the file could not be opened
     */
    bool load_defaults_file(const char *filename, uint16_t &num_loaded, uint16_t &num_ignored) WARN_IF_UNUSED;

    /// apply one line of a .parm file, false if it was not applied
    bool apply_defaults_line(const char *line, bool &was_blank) WARN_IF_UNUSED;

    /// print "NAME VALUE" for every parameter
    void show_all(FILE *stream) const;

private:
    std::vector<AT_Param::Info> _groups;

    struct Location {
        at_var_type type;
        void *ptr;
    };
    bool find(const char *name, Location &loc) const;
};
