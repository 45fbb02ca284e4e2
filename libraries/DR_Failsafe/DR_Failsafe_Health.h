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

/*
  tracks whether the flight is degraded: RC lost or the auxiliary
  distress switch raised. Going bad is immediate, recovery needs the
  inputs to stay good for DR_FAILSAFE_RECOVERY_DELAY_MS.
 */

#include <stdint.h>

#include "DR_Failsafe_config.h"

class DR_Failsafe_Health
{
public:
    enum class Transition : uint8_t {
        NONE = 0,
        DEGRADED,
        RECOVERED,
    };

    DR_Failsafe_Health();

    // called once per tick
    Transition update(bool rc_valid, bool aux_distress, uint32_t now_ms);

    // back to the boot state, degraded until proven healthy
    void reset();

    bool degraded() const { return _degraded; }
    bool rc_bad() const { return _rc_bad; }
    bool aux_bad() const { return _aux_bad; }
    bool recovery_pending() const { return _recovery_pending; }

private:
    bool _rc_bad;
    bool _aux_bad;
    bool _degraded;

    // set while inputs are good but the vehicle is still degraded
    bool _recovery_pending;
    uint32_t _recovery_start_ms;
};
