#pragma once

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
 * @file DR_Param.h
 * @brief Typed, named vehicle parameters
 *
 * @details Parameters are plain typed values (DR_Int8, DR_Float, ...) that
 *          live inside the objects that use them. Each class that owns
 *          parameters publishes a var_info[] GroupInfo table describing the
 *          name, index, type, offset and default of each of them, and calls
 *          setup_object_defaults() from its constructor.
 *
 *          The vehicle publishes one top-level Info table listing its scalar
 *          parameters and parameter groups, and registers it by constructing
 *          a DR_Param loader object. That table is what find(), set_by_name()
 *          and get() walk to reach a parameter by its full name, for example
 *          "DR_ENABLE_ALT" is the "ENABLE_ALT" entry of the group registered
 *          with prefix "DR_".
 *
 *          Values only live in RAM; they return to their defaults at boot.
 *
 * @note DR_Param has no data members so that DR_ParamT<T> has exactly the
 *       size of its value.
 */

#include <stddef.h>
#include <stdint.h>

#include <DR_HAL/DR_HAL_Macros.h>

#define DR_MAX_NAME_SIZE 16

/*
  offset of a member of a class, without the warnings offsetof()
  gives on non-standard-layout classes
 */
#define DR_VAROFFSET(type, element) (((ptrdiff_t)(&((const type *)1)->element))-1)

// declare a scalar parameter in a group table
#define DR_GROUPINFO(name, idx, clazz, element, def) { decltype(((clazz *)0)->element)::vtype, idx, name, DR_VAROFFSET(clazz, element), nullptr, (float)(def) }

// declare a nested parameter group in a group table
#define DR_SUBGROUPINFO(element, name, idx, thisclazz, elclazz) { DR_PARAM_GROUP, idx, name, DR_VAROFFSET(thisclazz, element), elclazz::var_info, 0.0f }

#define DR_GROUPEND     { DR_PARAM_NONE, 0xFF, "", 0, nullptr, 0.0f }

// entries of the top-level vehicle table
#define DR_VARINFO_SCALAR(v, name, def) { decltype(v)::vtype, name, &v, nullptr, (float)(def) }
#define DR_VARINFO_OBJECT(v, name, clazz) { DR_PARAM_GROUP, name, &v, clazz::var_info, 0.0f }
#define DR_VAREND       { DR_PARAM_NONE, "", nullptr, nullptr, 0.0f }

enum dr_var_type {
    DR_PARAM_NONE    = 0,
    DR_PARAM_INT8,
    DR_PARAM_INT16,
    DR_PARAM_INT32,
    DR_PARAM_FLOAT,
    DR_PARAM_GROUP
};

class DR_Param
{
public:
    struct GroupInfo {
        uint8_t type;                   // dr_var_type
        uint8_t idx;                    // unique within the group, never reused
        const char *name;
        ptrdiff_t offset;               // offset within the owning object
        const struct GroupInfo *group_info;
        float def_value;
    };

    struct Info {
        uint8_t type;                   // dr_var_type
        const char *name;
        const void *ptr;                // pointer to the variable in memory
        const struct GroupInfo *group_info;
        float def_value;
    };

    // constructor used by DR_ParamT values
    DR_Param() {}

    // constructor used to register the vehicle table
    DR_Param(const struct Info *info);

    /*
      set the defaults of all parameters of an object from its
      var_info table. Called from the constructor of parameter owners.
     */
    static void setup_object_defaults(const void *object_pointer, const struct GroupInfo *group_info);

    // reset every registered parameter, scalar and grouped, to its default
    static void load_defaults(void);

    // true once a vehicle table has been registered
    static bool initialised(void) { return _var_info != nullptr; }

    /*
      find a parameter by its full name, returning its type in ptype,
      or nullptr if there is no such parameter
     */
    static DR_Param *find(const char *name, enum dr_var_type *ptype);

    // set a parameter by name, false if not found
    static bool set_by_name(const char *name, float value);

    // get a parameter value by name as a float, false if not found
    static bool get(const char *name, float &value);

    /*
      call fn for every scalar parameter with its full name, value and
      type. Used to list parameters.
     */
    typedef void (*param_visitor)(const char *name, float value, enum dr_var_type type);
    static void show_all(param_visitor fn);

    // cast a parameter of the given type to a float
    float cast_to_float(enum dr_var_type type) const;

    // set a parameter of the given type from a float
    void set_float(float value, enum dr_var_type type);

private:
    static bool check_group_info(const struct GroupInfo *group_info, uint8_t prefix_length);
    static bool check_var_info(void);
    static DR_Param *find_group(const char *name, const struct GroupInfo *group_info, ptrdiff_t group_base, enum dr_var_type *ptype);
    static void show_group(const char *prefix, const struct GroupInfo *group_info, ptrdiff_t group_base, param_visitor fn);
    static bool is_scalar_type(uint8_t type) { return type > DR_PARAM_NONE && type < DR_PARAM_GROUP; }

    static const struct Info *_var_info;
    static uint16_t _num_vars;
};

/*
  template class for scalar variables
 */
template<typename T, enum dr_var_type PT>
class DR_ParamT : public DR_Param
{
public:
    static const enum dr_var_type vtype = PT;

    DR_ParamT() : DR_Param(), _value(0) {}

    const T &get(void) const {
        return _value;
    }

    void set(const T &v) {
        _value = v;
    }

    void set_default(const T &v) {
        _value = v;
    }

    operator const T &() const {
        return _value;
    }

    DR_ParamT<T,PT>& operator= (const T &v) {
        _value = v;
        return *this;
    }

protected:
    T _value;
};

typedef DR_ParamT<int8_t,  DR_PARAM_INT8>   DR_Int8;
typedef DR_ParamT<int16_t, DR_PARAM_INT16>  DR_Int16;
typedef DR_ParamT<int32_t, DR_PARAM_INT32>  DR_Int32;
typedef DR_ParamT<float,   DR_PARAM_FLOAT>  DR_Float;
