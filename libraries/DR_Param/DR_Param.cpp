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

/*
  DeadReckon parameter system

  Parameters are located through the vehicle var_info table. Storage
  of values across reboots is not handled here.
 */

#include <stdio.h>
#include <string.h>
#include <strings.h>
#include <cmath>

#include <DR_HAL/DR_HAL.h>

#include "DR_Param.h"

const DR_Param::Info *DR_Param::_var_info;
uint16_t DR_Param::_num_vars;

DR_Param::DR_Param(const struct Info *info)
{
    _var_info = info;

    uint16_t i;
    for (i=0; info[i].type != DR_PARAM_NONE; i++) ;
    _num_vars = i;

    if (!check_var_info()) {
        DR_HAL::panic("DR_Param: bad var_info table");
    }
}

// validate a group info table, recursing into sub-groups
bool DR_Param::check_group_info(const struct GroupInfo *group_info, uint8_t prefix_length)
{
    for (uint8_t i=0; group_info[i].type != DR_PARAM_NONE; i++) {
        const uint8_t idx = group_info[i].idx;
        for (uint8_t j=0; j<i; j++) {
            if (group_info[j].idx == idx) {
                // duplicate index
                return false;
            }
        }
        const size_t len = strlen(group_info[i].name);
        if (group_info[i].type == DR_PARAM_GROUP) {
            if (group_info[i].group_info == nullptr ||
                !check_group_info(group_info[i].group_info, prefix_length + len)) {
                return false;
            }
            continue;
        }
        if (!is_scalar_type(group_info[i].type)) {
            return false;
        }
        if (prefix_length + len > DR_MAX_NAME_SIZE) {
            // name too long
            return false;
        }
    }
    return true;
}

bool DR_Param::check_var_info(void)
{
    for (uint16_t i=0; i<_num_vars; i++) {
        const Info &info = _var_info[i];
        if (info.ptr == nullptr) {
            return false;
        }
        const size_t len = strlen(info.name);
        if (info.type == DR_PARAM_GROUP) {
            if (info.group_info == nullptr || !check_group_info(info.group_info, len)) {
                return false;
            }
            continue;
        }
        if (!is_scalar_type(info.type) || len > DR_MAX_NAME_SIZE) {
            return false;
        }
    }
    return true;
}

void DR_Param::setup_object_defaults(const void *object_pointer, const struct GroupInfo *group_info)
{
    const ptrdiff_t base = (ptrdiff_t)object_pointer;
    for (uint8_t i=0; group_info[i].type != DR_PARAM_NONE; i++) {
        const uint8_t type = group_info[i].type;
        if (type == DR_PARAM_GROUP) {
            setup_object_defaults((const void *)(base + group_info[i].offset), group_info[i].group_info);
        } else if (is_scalar_type(type)) {
            DR_Param *ap = (DR_Param *)(base + group_info[i].offset);
            ap->set_float(group_info[i].def_value, (enum dr_var_type)type);
        }
    }
}

void DR_Param::load_defaults(void)
{
    for (uint16_t i=0; i<_num_vars; i++) {
        const Info &info = _var_info[i];
        if (info.type == DR_PARAM_GROUP) {
            setup_object_defaults(info.ptr, info.group_info);
        } else {
            DR_Param *ap = (DR_Param *)info.ptr;
            ap->set_float(info.def_value, (enum dr_var_type)info.type);
        }
    }
}

DR_Param *DR_Param::find_group(const char *name, const struct GroupInfo *group_info,
                               ptrdiff_t group_base, enum dr_var_type *ptype)
{
    for (uint8_t i=0; group_info[i].type != DR_PARAM_NONE; i++) {
        const GroupInfo &gi = group_info[i];
        if (gi.type == DR_PARAM_GROUP) {
            const size_t len = strlen(gi.name);
            if (strncasecmp(name, gi.name, len) == 0) {
                DR_Param *ap = find_group(name + len, gi.group_info, group_base + gi.offset, ptype);
                if (ap != nullptr) {
                    return ap;
                }
            }
        } else if (strcasecmp(name, gi.name) == 0) {
            *ptype = (enum dr_var_type)gi.type;
            return (DR_Param *)(group_base + gi.offset);
        }
    }
    return nullptr;
}

DR_Param *DR_Param::find(const char *name, enum dr_var_type *ptype)
{
    for (uint16_t i=0; i<_num_vars; i++) {
        const Info &info = _var_info[i];
        if (info.type == DR_PARAM_GROUP) {
            const size_t len = strlen(info.name);
            if (strncasecmp(name, info.name, len) != 0) {
                continue;
            }
            DR_Param *ap = find_group(name + len, info.group_info, (ptrdiff_t)info.ptr, ptype);
            if (ap != nullptr) {
                return ap;
            }
            continue;
        }
        if (strcasecmp(name, info.name) == 0) {
            *ptype = (enum dr_var_type)info.type;
            return (DR_Param *)info.ptr;
        }
    }
    return nullptr;
}

bool DR_Param::set_by_name(const char *name, float value)
{
    enum dr_var_type vtype;
    DR_Param *vp = find(name, &vtype);
    if (vp == nullptr) {
        return false;
    }
    vp->set_float(value, vtype);
    return true;
}

bool DR_Param::get(const char *name, float &value)
{
    enum dr_var_type vtype;
    const DR_Param *vp = find(name, &vtype);
    if (vp == nullptr) {
        return false;
    }
    value = vp->cast_to_float(vtype);
    return true;
}

void DR_Param::show_group(const char *prefix, const struct GroupInfo *group_info,
                          ptrdiff_t group_base, param_visitor fn)
{
    char name[DR_MAX_NAME_SIZE+1];
    for (uint8_t i=0; group_info[i].type != DR_PARAM_NONE; i++) {
        const GroupInfo &gi = group_info[i];
        snprintf(name, sizeof(name), "%s%s", prefix, gi.name);
        if (gi.type == DR_PARAM_GROUP) {
            show_group(name, gi.group_info, group_base + gi.offset, fn);
            continue;
        }
        const DR_Param *ap = (const DR_Param *)(group_base + gi.offset);
        fn(name, ap->cast_to_float((enum dr_var_type)gi.type), (enum dr_var_type)gi.type);
    }
}

void DR_Param::show_all(param_visitor fn)
{
    for (uint16_t i=0; i<_num_vars; i++) {
        const Info &info = _var_info[i];
        if (info.type == DR_PARAM_GROUP) {
            show_group(info.name, info.group_info, (ptrdiff_t)info.ptr, fn);
            continue;
        }
        const DR_Param *ap = (const DR_Param *)info.ptr;
        fn(info.name, ap->cast_to_float((enum dr_var_type)info.type), (enum dr_var_type)info.type);
    }
}

float DR_Param::cast_to_float(enum dr_var_type type) const
{
    switch (type) {
    case DR_PARAM_INT8:
        return ((DR_Int8 *)this)->get();
    case DR_PARAM_INT16:
        return ((DR_Int16 *)this)->get();
    case DR_PARAM_INT32:
        return ((DR_Int32 *)this)->get();
    case DR_PARAM_FLOAT:
        return ((DR_Float *)this)->get();
    default:
        return NAN;
    }
}

void DR_Param::set_float(float value, enum dr_var_type type)
{
    if (std::isnan(value) || std::isinf(value)) {
        return;
    }

    // add a 0.5 to ensure correct rounding of integer values
    const float rounded_val = (value < 0) ? value - 0.5f : value + 0.5f;

    switch (type) {
    case DR_PARAM_INT8:
        if (rounded_val < INT8_MIN || rounded_val > INT8_MAX) {
            return;
        }
        ((DR_Int8 *)this)->set((int8_t)rounded_val);
        break;
    case DR_PARAM_INT16:
        if (rounded_val < INT16_MIN || rounded_val > INT16_MAX) {
            return;
        }
        ((DR_Int16 *)this)->set((int16_t)rounded_val);
        break;
    case DR_PARAM_INT32:
        if (rounded_val < -2147483520.0f || rounded_val > 2147483520.0f) {
            // float precision limit
            return;
        }
        ((DR_Int32 *)this)->set((int32_t)rounded_val);
        break;
    case DR_PARAM_FLOAT:
        ((DR_Float *)this)->set(value);
        break;
    default:
        break;
    }
}
