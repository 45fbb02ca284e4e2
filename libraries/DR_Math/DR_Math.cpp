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

#include "DR_Math.h"

template <typename Arithmetic1, typename Arithmetic2>
typename std::enable_if<std::is_integral<typename std::common_type<Arithmetic1, Arithmetic2>::type>::value ,bool>::type
is_equal(const Arithmetic1 v_1, const Arithmetic2 v_2)
{
    typedef typename std::common_type<Arithmetic1, Arithmetic2>::type common_type;
    return static_cast<common_type>(v_1) == static_cast<common_type>(v_2);
}

template <typename Arithmetic1, typename Arithmetic2>
typename std::enable_if<std::is_floating_point<typename std::common_type<Arithmetic1, Arithmetic2>::type>::value, bool>::type
is_equal(const Arithmetic1 v_1, const Arithmetic2 v_2)
{
    typedef typename std::common_type<Arithmetic1, Arithmetic2>::type common_type;
    return fabsf(static_cast<float>(static_cast<common_type>(v_1) - static_cast<common_type>(v_2))) < FLT_EPSILON;
}

template bool is_equal<int>(const int v_1, const int v_2);
template bool is_equal<int16_t>(const int16_t v_1, const int16_t v_2);
template bool is_equal<uint32_t>(const uint32_t v_1, const uint32_t v_2);
template bool is_equal<float>(const float v_1, const float v_2);

float wrap_360(const float angle)
{
    float res = fmodf(angle, 360.0f);
    if (res < 0) {
        res += 360.0f;
    }
    return res;
}

float wrap_180(const float angle)
{
    float res = wrap_360(angle);
    if (res > 180.0f) {
        res -= 360.0f;
    }
    return res;
}

template <typename T>
T constrain_value(const T amt, const T low, const T high)
{
    // the check for NaN as a float prevents propagation of floating point
    // errors through any function that uses constrain_value()
    if (std::is_floating_point<T>::value) {
        if (std::isnan(amt)) {
            return (low + high) / 2;
        }
    }

    if (amt < low) {
        return low;
    }

    if (amt > high) {
        return high;
    }

    return amt;
}

template int16_t constrain_value<int16_t>(const int16_t amt, const int16_t low, const int16_t high);
template int32_t constrain_value<int32_t>(const int32_t amt, const int32_t low, const int32_t high);
template float constrain_value<float>(const float amt, const float low, const float high);
