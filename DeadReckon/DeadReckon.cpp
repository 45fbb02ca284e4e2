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
 * @file DeadReckon.cpp
 * @brief Main loop of the simulated copter and its DR_Vehicle interface
 *
 * @details Each call of loop() advances the simulated clock by one
 *          MAIN_LOOP_MS step. Within a step the pilot script moves the
 *          sticks, the radio is read, the failsafe runs when its interval
 *          has elapsed, the flight mode turns inputs into a desired
 *          attitude and the airframe model moves the vehicle.
 */

#include <DR_HAL_SITL/DR_HAL_SITL.h>

#include "DeadReckon.h"

const DR_HAL::HAL& hal = DR_HAL::get_HAL();

DeadReckon::DeadReckon(void) :
    param_loader(var_info),
    log_backend(nullptr),
    failsafe(*this),
    armed(false),
    landed(true),
    start_ms(0),
    control_mode(DR_Mode::Number::STABILIZE),
    control_mode_reason(ModeReason::UNKNOWN),
    last_radio_update_ms(0),
    failsafe_radio(false),
    pilot_phase(PilotPhase::TAKEOFF),
    outbound_start_ms(0),
    rc_failed_injected(false),
    rc_recovered_injected(false),
    aux_injected(false),
    guided_target(),
    guided_target_ms(0),
    desired(),
    sim(),
    max_distance(0),
    last_failsafe_ms(0),
    failsafe_interval_ms(0),
    last_log_sim_ms(0),
    summary_printed(false)
{
}

void DeadReckon::loop()
{
    const uint32_t now_ms = DR_HAL::millis();
    const float dt = MAIN_LOOP_MS * 0.001f;

    update_pilot(now_ms);
    read_radio();

    if (DR_HAL::timeout_expired(last_failsafe_ms, now_ms, failsafe_interval_ms)) {
        last_failsafe_ms = now_ms;
        failsafe_interval_ms = failsafe.update();
    }

    update_flight_mode(now_ms, dt);
    update_sim(dt);

    if (now_ms - last_log_sim_ms >= LOG_SIM_INTERVAL_MS) {
        last_log_sim_ms = now_ms;
        Log_Write_Sim();
    }

    // stop once disarmed after landing, or at the end of the run
    const uint64_t end_ms = uint64_t(HALSITL::HAL_SITL::get_options().duration_s * 1000.0f);
    if (!armed || DR_HAL::millis64() + MAIN_LOOP_MS >= end_ms) {
        print_summary();
        HALSITL::HAL_SITL::request_exit();
    }

    hal.scheduler->delay(MAIN_LOOP_MS);
}

bool DeadReckon::has_valid_rc_input() const
{
    return !failsafe_radio;
}

bool DeadReckon::get_rc_pwm(uint8_t chan, uint16_t &pwm) const
{
    if (failsafe_radio || chan == 0 || chan > hal.rcin->num_channels()) {
        return false;
    }
    pwm = hal.rcin->read(chan - 1);
    return pwm != 0;
}

void DeadReckon::get_attitude(float &roll_rad, float &pitch_rad, float &yaw_rad) const
{
    roll_rad = radians(sim.roll_deg);
    pitch_rad = radians(sim.pitch_deg);
    yaw_rad = radians(wrap_180(sim.yaw_deg));
}

bool DeadReckon::get_relative_position_D_home(float &posD) const
{
    // home is set on arming
    if (!armed) {
        return false;
    }
    posD = -sim.alt;
    return true;
}

bool DeadReckon::set_target_angle_and_climbrate(float roll_deg, float pitch_deg, float yaw_deg,
                                                float climb_rate_ms, bool use_yaw_rate,
                                                float yaw_rate_degs)
{
    // only accept command in guided mode without position control
    if (control_mode != DR_Mode::Number::GUIDED_NOGPS) {
        return false;
    }

    guided_target.roll_deg = constrain_float(roll_deg, -PILOT_ANGLE_MAX_DEG, PILOT_ANGLE_MAX_DEG);
    guided_target.pitch_deg = constrain_float(pitch_deg, -PILOT_ANGLE_MAX_DEG, PILOT_ANGLE_MAX_DEG);
    if (use_yaw_rate) {
        guided_target.yaw_deg = wrap_360(sim.yaw_deg + yaw_rate_degs * MAIN_LOOP_MS * 0.001f);
    } else {
        guided_target.yaw_deg = wrap_360(yaw_deg);
    }
    guided_target.climb_rate_ms = climb_rate_ms;
    guided_target_ms = DR_HAL::millis();
    return true;
}

DeadReckon deadreckon;

DR_HAL_MAIN_CALLBACKS(&deadreckon);
