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
  interface between the dead reckoning failsafe and the vehicle it
  protects. The vehicle code implements this on top of its own AHRS,
  RC input, arming and mode handling.
 */

#include <stdint.h>

#include "DR_Mode.h"

class DR_Vehicle
{
public:
    virtual ~DR_Vehicle() {}

    // true while the RC receiver delivers valid frames
    virtual bool has_valid_rc_input() const = 0;

    // pwm of an RC channel, chan is 1 based. false if unavailable
    virtual bool get_rc_pwm(uint8_t chan, uint16_t &pwm) const = 0;

    virtual bool is_armed() const = 0;

    virtual DR_Mode::Number get_mode() const = 0;
    virtual bool set_mode(DR_Mode::Number mode, ModeReason reason) = 0;

    // current attitude in radians, yaw in the range -PI to PI
    virtual void get_attitude(float &roll_rad, float &pitch_rad, float &yaw_rad) const = 0;

    // NED down distance from home in meters, false if home or position are unknown
    virtual bool get_relative_position_D_home(float &posD) const = 0;

    /*
      command a lean angle in degrees, a heading in degrees and a climb
      rate in m/s. Only accepted in GUIDED_NOGPS.
     */
    virtual bool set_target_angle_and_climbrate(float roll_deg, float pitch_deg, float yaw_deg,
                                                float climb_rate_ms, bool use_yaw_rate,
                                                float yaw_rate_degs) = 0;
};
