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
 * @file DR_Failsafe_Command.h
 * @brief Attitude and climb rate targets flown by the dead reckoning failsafe
 *
 * @details Stateless helpers used by DR_Failsafe while leveling and flying
 *          home. Angles are in degrees, climb rates in m/s (positive up).
 *          The fly home target replays the attitude history backwards with
 *          the pitch inverted, so that a vehicle that pitched forward on
 *          the way out pitches back on the way home.
 */

#include <stddef.h>
#include <stdint.h>

#include "DR_AttitudeHistory.h"

// attitude and climb rate handed to the vehicle
struct DR_AttitudeTarget {
    float roll_deg;
    float pitch_deg;
    float yaw_deg;
    float climb_rate_ms;
};

class DR_Failsafe_Command
{
public:
    /**
     * @brief Climb rate for the current altitude above home
     *
     * @param[in] alt_m        altitude above home in meters
     * @param[in] low_alt_m    at or below this the full rate is used
     * @param[in] mid_alt_m    between low_alt_m and this the trickle rate is used
     * @param[in] full_rate_ms full climb rate
     * @param[in] trickle_ms   trickle climb rate
     *
     * @return climb rate in m/s, zero at or above mid_alt_m
     */
    static float climb_rate(float alt_m, float low_alt_m, float mid_alt_m,
                            float full_rate_ms, float trickle_ms);

    // wings level at yaw_deg with no climb
    static DR_AttitudeTarget level_target(float yaw_deg);

    /**
     * @brief Next target of the flight home
     *
     * @details Removes the newest sample from the history and commands its
     *          roll and inverted pitch at its yaw, which becomes the new
     *          target_yaw_deg. Once only one sample is left the vehicle is
     *          held level at target_yaw_deg.
     *
     * @param[in,out] history        recorded attitudes
     * @param[in,out] target_yaw_deg last commanded yaw
     * @param[in]     lean_limit_deg roll and pitch limit, zero for none
     *
     * @return true if a sample was consumed
     */
    static bool fly_home_target(DR_AttitudeHistory &history, float &target_yaw_deg,
                                float lean_limit_deg, DR_AttitudeTarget &target);

    // "DR: fly home ..." status line, time left only shown if show_time_left
    static void format_fly_home_status(char *buf, size_t buflen, const DR_AttitudeTarget &target,
                                       bool show_time_left, uint32_t time_left_ms);
};
