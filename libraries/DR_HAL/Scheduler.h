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

#include <stdint.h>

#include "DR_HAL_Namespace.h"

/**
 * @class DR_HAL::Scheduler
 * @brief Timing services of the board
 *
 * @details The vehicle main loop is cooperative: a single thread calls the
 *          vehicle loop and sleeps with delay() between iterations. Boards
 *          with a simulated clock may stop the clock so that time only
 *          advances through stop_clock() or delay().
 */
class DR_HAL::Scheduler {
public:
    Scheduler() {}
    virtual void     init() = 0;
    virtual void     delay(uint16_t ms) = 0;
    virtual void     delay_microseconds(uint16_t us) = 0;

    virtual void     set_system_initialized() = 0;
    virtual bool     is_system_initialized() = 0;

    // stop the clock at the given time (simulation boards only)
    virtual void     stop_clock(uint64_t time_usec) {}

    virtual bool     in_main_thread() const = 0;
};
