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

#include "Scheduler.h"

void HALSITL::Scheduler::init()
{
    _initialized = false;
    _stopped_clock_usec = 0;
}

void HALSITL::Scheduler::delay(uint16_t ms)
{
    _stopped_clock_usec += uint64_t(ms) * 1000ULL;
}

void HALSITL::Scheduler::delay_microseconds(uint16_t us)
{
    _stopped_clock_usec += us;
}

void HALSITL::Scheduler::set_system_initialized()
{
    if (_initialized) {
        DR_HAL::panic("PANIC: scheduler::system_initialized called more than once");
    }
    _initialized = true;
}

void HALSITL::Scheduler::stop_clock(uint64_t time_usec)
{
    _stopped_clock_usec = time_usec;
}
