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

#include "DR_Failsafe_Command.h"

#include <stdio.h>
#include <math.h>

#include <DR_Math/DR_Math.h>

float DR_Failsafe_Command::climb_rate(float alt_m, float low_alt_m, float mid_alt_m,
                                      float full_rate_ms, float trickle_ms)
{
    if (alt_m <= low_alt_m) {
        return full_rate_ms;
    }
    if (alt_m < mid_alt_m) {
        return trickle_ms;
    }
    return 0.0f;
}

DR_AttitudeTarget DR_Failsafe_Command::level_target(float yaw_deg)
{
    DR_AttitudeTarget target;
    target.roll_deg = 0.0f;
    target.pitch_deg = 0.0f;
    target.yaw_deg = yaw_deg;
    target.climb_rate_ms = 0.0f;
    return target;
}

bool DR_Failsafe_Command::fly_home_target(DR_AttitudeHistory &history, float &target_yaw_deg,
                                          float lean_limit_deg, DR_AttitudeTarget &target)
{
    DR_AttitudeSample sample;
    if (!history.pop(sample)) {
        target = level_target(target_yaw_deg);
        return false;
    }

    target_yaw_deg = sample.yaw;
    target.roll_deg = sample.roll;
    target.pitch_deg = -sample.pitch;
    target.yaw_deg = sample.yaw;
    target.climb_rate_ms = 0.0f;

    if (is_positive(lean_limit_deg)) {
        target.roll_deg = constrain_float(target.roll_deg, -lean_limit_deg, lean_limit_deg);
        target.pitch_deg = constrain_float(target.pitch_deg, -lean_limit_deg, lean_limit_deg);
    }
    return true;
}

void DR_Failsafe_Command::format_fly_home_status(char *buf, size_t buflen, const DR_AttitudeTarget &target,
                                                 bool show_time_left, uint32_t time_left_ms)
{
    const int n = snprintf(buf, buflen, "DR: fly home roll:%d pit:%d yaw:%d cr:%.1f",
                           (int)floorf(target.roll_deg),
                           (int)floorf(target.pitch_deg),
                           (int)floorf(target.yaw_deg),
                           (double)(floorf(target.climb_rate_ms * 10.0f) * 0.1f));
    if (!show_time_left || n < 0 || (size_t)n >= buflen) {
        return;
    }
    snprintf(&buf[n], buflen - n, " t:%u", (unsigned)(time_left_ms / 1000U));
}
