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

#include <cmath>
#include <stdint.h>
#include <type_traits>

#include "definitions.h"

/*
 * Check whether a float is zero
 */
inline bool is_zero(const float fVal1) {
    return (fabsf(fVal1) < FLT_EPSILON);
}

/*
 * Check whether a float is greater than zero
 */
inline bool is_positive(const float fVal1) {
    return (fVal1 >= FLT_EPSILON);
}

/*
 * Check whether a float is less than zero
 */
inline bool is_negative(const float fVal1) {
    return (fVal1 <= (-1.0f * FLT_EPSILON));
}

/*
 * Generic float/integer equality check, floats compare within FLT_EPSILON
 */
template <typename Arithmetic1, typename Arithmetic2>
typename std::enable_if<std::is_integral<typename std::common_type<Arithmetic1, Arithmetic2>::type>::value ,bool>::type
is_equal(const Arithmetic1 v_1, const Arithmetic2 v_2);

template <typename Arithmetic1, typename Arithmetic2>
typename std::enable_if<std::is_floating_point<typename std::common_type<Arithmetic1, Arithmetic2>::type>::value, bool>::type
is_equal(const Arithmetic1 v_1, const Arithmetic2 v_2);

/*
  wrap an angle in degrees to -180..180
 */
float wrap_180(const float angle);

/*
  wrap an angle in degrees to 0..360
 */
float wrap_360(const float angle);

/*
  constrain a value to be between low and high. NaN inputs return
  the midpoint so a bad sensor value never escapes the limits.
 */
template <typename T>
T constrain_value(const T amt, const T low, const T high);

#define constrain_float(amt, low, high) constrain_value(float(amt), float(low), float(high))

inline int16_t constrain_int16(const int16_t amt, const int16_t low, const int16_t high)
{
    return constrain_value(amt, low, high);
}

inline int32_t constrain_int32(const int32_t amt, const int32_t low, const int32_t high)
{
    return constrain_value(amt, low, high);
}

// degrees -> radians
static inline constexpr float radians(float deg)
{
    return deg * DEG_TO_RAD;
}

// radians -> degrees
static inline constexpr float degrees(float rad)
{
    return rad * RAD_TO_DEG;
}

template<typename T>
constexpr T sq(const T val)
{
    return val*val;
}

// 2D vector length
static inline float norm(const float first, const float second)
{
    return sqrtf(sq(first) + sq(second));
}
