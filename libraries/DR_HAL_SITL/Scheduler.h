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

#include "DR_HAL_SITL_Namespace.h"

/**
 * @class HALSITL::Scheduler
 * @brief Scheduler with a fully simulated clock
 *
 * @details Time never advances on its own: delay() moves the clock forward
 *          by the requested amount and stop_clock() sets it directly. This
 *          makes every run of the simulated vehicle and every unit test
 *          reproducible tick for tick.
 */
class HALSITL::Scheduler : public DR_HAL::Scheduler {
public:
    static Scheduler *from(DR_HAL::Scheduler *scheduler) {
        return static_cast<HALSITL::Scheduler*>(scheduler);
    }

    void init() override;
    void delay(uint16_t ms) override;
    void delay_microseconds(uint16_t us) override;

    bool is_system_initialized() override { return _initialized; }
    void set_system_initialized() override;

    void stop_clock(uint64_t time_usec) override;
    bool in_main_thread() const override { return true; }

    uint64_t stopped_clock_usec() const { return _stopped_clock_usec; }

private:
    bool _initialized;
    uint64_t _stopped_clock_usec;
};
