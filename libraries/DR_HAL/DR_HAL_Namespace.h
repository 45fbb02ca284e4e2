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

namespace DR_HAL {
    class HAL;
    class RCInput;
    class Scheduler;

    typedef void(*Proc)(void);

    // access to the board specific HAL, provided by the selected backend
    const HAL& get_HAL();
    HAL& get_HAL_mutable();
} // namespace DR_HAL
