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
 * @file system.h
 * @brief Board independent system services: time base and panic
 *
 * @details All times are measured from boot. On the SITL board the clock is
 *          driven by the simulation so that tests and the simulated vehicle
 *          are fully deterministic.
 */

#include <stdint.h>
#include <type_traits>

#include "DR_HAL_Macros.h"

namespace DR_HAL {

void init();

/// report an unrecoverable framework error and stop
void panic(const char *errormsg, ...) FMT_PRINTF(1, 2) NORETURN;

uint32_t micros();
uint32_t millis();
uint64_t micros64();
uint64_t millis64();

/*
  return true if timeout has expired since past_time. Works across a
  wrap of the time counter as long as all three values share the same
  unsigned type.
 */
template <typename T, typename S, typename R>
inline bool timeout_expired(const T past_time, const S now, const R timeout)
{
    static_assert(std::is_same<T, S>::value, "timeout_expired() must compare values of the same unsigned type");
    static_assert(std::is_unsigned<T>::value, "timeout_expired() must use unsigned times");
    static_assert(std::is_unsigned<R>::value, "timeout_expired() must use unsigned timeouts");
    const T dt = now - past_time;
    return (dt >= timeout);
}

/*
  time left before timeout expires, zero once expired
 */
template <typename T, typename S, typename R>
inline T timeout_remaining(const T past_time, const S now, const R timeout)
{
    static_assert(std::is_same<T, S>::value, "timeout_remaining() must compare values of the same unsigned type");
    static_assert(std::is_unsigned<T>::value, "timeout_remaining() must use unsigned times");
    static_assert(std::is_unsigned<R>::value, "timeout_remaining() must use unsigned timeouts");
    const T dt = now - past_time;
    return (dt >= timeout) ? T(0) : T(timeout - dt);
}

} // namespace DR_HAL
