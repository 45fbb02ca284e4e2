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
 * @file DR_Failsafe.h
 * @brief Dead reckoning failsafe for multicopters
 *
 * @details When the RC link is lost, or the pilot raises the auxiliary
 *          distress switch, the vehicle is flown back along the way it came
 *          using only the attitudes recorded while the flight was healthy.
 *          No position estimate is used during the flight home.
 *
 *          The failsafe moves through four stages:
 *          - IDLE: waiting for a healthy flight above DR_ENABLE_ALT
 *          - MONITORING: recording attitude, remembering the flight mode
 *          - LEVELING: in GUIDED_NOGPS, holding the vehicle level for
 *            DR_FAILSAFE_LEVEL_TIME_MS at the last heading
 *          - FLY_HOME_BLIND: replaying the recorded attitudes newest first
 *            with the pitch inverted, climbing to clear terrain
 *
 *          The flight home lasts at most as long as the flight out. Once the
 *          vehicle recovers, or that time runs out, it is switched to
 *          DR_NEXT_MODE, the mode it was in before the failsafe, or RTL.
 *          Switching out of GUIDED_NOGPS hands control back to the pilot.
 *
 *          update() is called at the interval it returns. Disarming resets
 *          the failsafe.
 */

#include <stdint.h>

#include <DR_HAL/DR_HAL_Macros.h>
#include <DR_Param/DR_Param.h>

#include "DR_Failsafe_config.h"
#include "DR_AttitudeHistory.h"
#include "DR_Failsafe_Command.h"
#include "DR_Failsafe_Health.h"
#include "DR_Mode.h"
#include "DR_Vehicle.h"

class DR_Failsafe
{
public:
    enum class Stage : uint8_t {
        IDLE = 0,
        MONITORING = 1,
        LEVELING = 2,
        FLY_HOME_BLIND = 3,
    };

    DR_Failsafe(DR_Vehicle &vehicle);

    CLASS_NO_COPY(DR_Failsafe);

    static const struct DR_Param::GroupInfo var_info[];

    // return to the boot state, including the health monitor
    void init();

    // run one tick, returns the number of milliseconds until the next call
    uint32_t update();

    bool enabled() const { return _enable > 0; }

    Stage stage() const { return _stage; }
    bool degraded() const { return _health.degraded(); }
    const DR_Failsafe_Health &health() const { return _health; }
    const DR_AttitudeHistory &history() const { return _history; }
    float target_yaw() const { return _target_yaw; }
    uint32_t time_left_ms() const { return _time_left_ms; }

    // mode flown before the failsafe took over, false if none recorded
    bool saved_mode(DR_Mode::Number &mode) const;

    uint32_t interval_ms() const;

    // 1 based RC channel of the distress switch, 0 if unused
    uint8_t aux_chan() const { return _aux_chan > 0 ? uint8_t(_aux_chan) : 0; }

private:
    void reset_stage();
    void set_stage(Stage stage);

    bool aux_distress();
    float get_alt_above_home() const;

    void update_idle(uint32_t now_ms);
    void update_monitoring(uint32_t now_ms);
    void update_leveling(uint32_t now_ms);
    void update_fly_home(uint32_t now_ms);

    // true if the pilot switched out of GUIDED_NOGPS, stage is then MONITORING
    bool pilot_override();

    void recover(bool timed_out);
    void log_fly_home(const DR_AttitudeTarget &target, uint32_t time_left_ms, bool timed_out);

    DR_Vehicle &_vehicle;

    // parameters
    DR_Int8  _enable;
    DR_Float _enable_alt;
    DR_Float _fly_angle;
    DR_Int16 _fly_timeout;
    DR_Int8  _next_mode;
    DR_Float _climb_low_alt;
    DR_Float _climb_mid_alt;
    DR_Float _climb_rate;
    DR_Float _climb_trickle;
    DR_Int8  _aux_chan;
    DR_Int16 _aux_pwm;
    DR_Int16 _interval;

    DR_Failsafe_Health _health;
    bool _aux_distress;
    DR_AttitudeHistory _history;

    Stage _stage;
    uint32_t _stage1_start_ms;      // MONITORING started
    uint32_t _stage2_start_ms;      // LEVELING started
    uint32_t _stage3_start_ms;      // FLY_HOME_BLIND started

    bool _have_saved_mode;
    DR_Mode::Number _saved_mode;

    float _target_yaw;
    uint32_t _time_left_ms;         // unused flight home time carried to the next failsafe

    // status messages are sent at most once per DR_FAILSAFE_USER_UPDATE_MS
    bool _update_user;
    uint32_t _last_user_update_ms;
};
