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

#include "DR_Failsafe.h"

#include <math.h>

#include <DR_HAL/DR_HAL.h>
#include <DR_Logger/DR_Logger.h>
#include <DR_Math/DR_Math.h>
#include <GCS/GCS.h>

const DR_Param::GroupInfo DR_Failsafe::var_info[] = {
    // @Param: ENABLE
    // @DisplayName: Dead reckoning failsafe enable
    // @Description: Enables the dead reckoning failsafe. When disabled the failsafe does not run at all
    // @Values: 0:Disabled,1:Enabled
    // @User: Standard
    DR_GROUPINFO("ENABLE", 1, DR_Failsafe, _enable, 1),

    // @Param: ENABLE_ALT
    // @DisplayName: Dead reckoning enable altitude
    // @Description: Altitude above home the vehicle must reach before attitude recording starts
    // @Units: m
    // @Range: 0 500
    // @User: Standard
    DR_GROUPINFO("ENABLE_ALT", 2, DR_Failsafe, _enable_alt, 15),

    // @Param: FLY_ANGLE
    // @DisplayName: Dead reckoning lean angle limit
    // @Description: Maximum roll and pitch commanded while flying home. 0 to fly the recorded angles unchanged
    // @Units: deg
    // @Range: 0 60
    // @User: Advanced
    DR_GROUPINFO("FLY_ANGLE", 3, DR_Failsafe, _fly_angle, 0),

    // @Param: FLY_TIMEOUT
    // @DisplayName: Dead reckoning flight time limit
    // @Description: Longest a single flight home may last, also shown as the time left in the status text. 0 to only limit it by the duration of the flight out
    // @Units: s
    // @Range: 0 3600
    // @User: Standard
    DR_GROUPINFO("FLY_TIMEOUT", 4, DR_Failsafe, _fly_timeout, 0),

    // @Param: NEXT_MODE
    // @DisplayName: Dead reckoning recovery mode
    // @Description: Flight mode to switch to once the vehicle recovers or the flight home ends. -1 to return to the mode flown before the failsafe
    // @Values: -1:Previous mode,0:Stabilize,2:AltHold,3:Auto,5:Loiter,6:RTL,9:Land,16:PosHold
    // @User: Standard
    DR_GROUPINFO("NEXT_MODE", 5, DR_Failsafe, _next_mode, 2),

    // @Param: CLMB_LOW_ALT
    // @DisplayName: Dead reckoning full climb altitude
    // @Description: At or below this altitude above home the vehicle climbs at DR_CLMB_RATE while flying home
    // @Units: m
    // @User: Advanced
    DR_GROUPINFO("CLMB_LOW_ALT", 6, DR_Failsafe, _climb_low_alt, 200),

    // @Param: CLMB_MID_ALT
    // @DisplayName: Dead reckoning trickle climb altitude
    // @Description: Below this altitude above home, and above DR_CLMB_LOW_ALT, the vehicle climbs at DR_CLMB_TRICKLE. Above it the altitude is held
    // @Units: m
    // @User: Advanced
    DR_GROUPINFO("CLMB_MID_ALT", 7, DR_Failsafe, _climb_mid_alt, 500),

    // @Param: CLMB_RATE
    // @DisplayName: Dead reckoning climb rate
    // @Units: m/s
    // @Range: 0 5
    // @User: Advanced
    DR_GROUPINFO("CLMB_RATE", 8, DR_Failsafe, _climb_rate, 1.0f),

    // @Param: CLMB_TRICKLE
    // @DisplayName: Dead reckoning trickle climb rate
    // @Units: m/s
    // @Range: 0 5
    // @User: Advanced
    DR_GROUPINFO("CLMB_TRICKLE", 9, DR_Failsafe, _climb_trickle, 0.1f),

    // @Param: AUX_CHAN
    // @DisplayName: Dead reckoning distress channel
    // @Description: RC channel of a switch that triggers the failsafe as if RC was lost. 0 to not use a switch
    // @Range: 0 16
    // @User: Standard
    DR_GROUPINFO("AUX_CHAN", 10, DR_Failsafe, _aux_chan, 8),

    // @Param: AUX_PWM
    // @DisplayName: Dead reckoning distress pwm
    // @Description: PWM on DR_AUX_CHAN above which the failsafe is triggered. Below it the switch is released, exactly this value keeps the last state
    // @Units: PWM
    // @Range: 900 2100
    // @User: Standard
    DR_GROUPINFO("AUX_PWM", 11, DR_Failsafe, _aux_pwm, 1600),

    // @Param: INTERVAL_MS
    // @DisplayName: Dead reckoning update interval
    // @Units: ms
    // @Range: 10 1000
    // @User: Advanced
    DR_GROUPINFO("INTERVAL_MS", 12, DR_Failsafe, _interval, 100),

    DR_GROUPEND
};

DR_Failsafe::DR_Failsafe(DR_Vehicle &vehicle) :
    _vehicle(vehicle)
{
    DR_Param::setup_object_defaults(this, var_info);
    init();
}

void DR_Failsafe::init()
{
    _health.reset();
    _aux_distress = false;
    _stage = Stage::IDLE;
    _history.clear();
    _stage1_start_ms = 0;
    _stage2_start_ms = 0;
    _stage3_start_ms = 0;
    _have_saved_mode = false;
    _saved_mode = DR_Mode::Number::STABILIZE;
    _target_yaw = 0.0f;
    _time_left_ms = 0;
    _update_user = false;
    _last_user_update_ms = 0;
}

/*
  disarmed: forget everything about the last flight. The health
  monitor keeps running.
 */
void DR_Failsafe::reset_stage()
{
    if (_stage != Stage::IDLE || !_history.empty()) {
        LOGGER_WRITE_EVENT(LogEvent::DR_STAGE_RESET);
    }
    _stage = Stage::IDLE;
    _history.clear();
    _stage1_start_ms = 0;
    _stage2_start_ms = 0;
    _stage3_start_ms = 0;
    _have_saved_mode = false;
    _target_yaw = 0.0f;
    _time_left_ms = 0;
}

void DR_Failsafe::set_stage(Stage stage)
{
    _stage = stage;
    switch (stage) {
    case Stage::IDLE:
        break;
    case Stage::MONITORING:
        LOGGER_WRITE_EVENT(LogEvent::DR_ENABLED);
        break;
    case Stage::LEVELING:
        LOGGER_WRITE_EVENT(LogEvent::DR_LEVEL_START);
        break;
    case Stage::FLY_HOME_BLIND:
        LOGGER_WRITE_EVENT(LogEvent::DR_FLY_HOME_START);
        break;
    }
}

bool DR_Failsafe::saved_mode(DR_Mode::Number &mode) const
{
    if (!_have_saved_mode) {
        return false;
    }
    mode = _saved_mode;
    return true;
}

uint32_t DR_Failsafe::interval_ms() const
{
    return (uint32_t)constrain_int16(_interval, DR_FAILSAFE_INTERVAL_MIN_MS, DR_FAILSAFE_INTERVAL_MAX_MS);
}

/*
  true when the distress switch is raised. Above DR_AUX_PWM raises it,
  below lowers it, exactly DR_AUX_PWM keeps the last state.
 */
bool DR_Failsafe::aux_distress()
{
    if (_aux_chan <= 0) {
        _aux_distress = false;
        return false;
    }
    uint16_t pwm;
    if (!_vehicle.get_rc_pwm((uint8_t)_aux_chan.get(), pwm)) {
        _aux_distress = false;
        return false;
    }
    if (pwm > _aux_pwm) {
        _aux_distress = true;
    } else if (pwm < _aux_pwm) {
        _aux_distress = false;
    }
    return _aux_distress;
}

// altitude above home in meters, zero if unknown
float DR_Failsafe::get_alt_above_home() const
{
    float posD;
    if (!_vehicle.get_relative_position_D_home(posD)) {
        return 0.0f;
    }
    return -posD;
}

uint32_t DR_Failsafe::update()
{
    if (_enable <= 0) {
        return DR_FAILSAFE_DISABLED_INTERVAL_MS;
    }

    const uint32_t now_ms = DR_HAL::millis();

    _update_user = false;
    if (now_ms - _last_user_update_ms > DR_FAILSAFE_USER_UPDATE_MS) {
        _update_user = true;
        _last_user_update_ms = now_ms;
    }

    _health.update(_vehicle.has_valid_rc_input(), aux_distress(), now_ms);

    if (!_vehicle.is_armed()) {
        reset_stage();
        return interval_ms();
    }

    switch (_stage) {
    case Stage::IDLE:
        update_idle(now_ms);
        break;
    case Stage::MONITORING:
        update_monitoring(now_ms);
        break;
    case Stage::LEVELING:
        update_leveling(now_ms);
        break;
    case Stage::FLY_HOME_BLIND:
        update_fly_home(now_ms);
        break;
    default:
        INTERNAL_ERROR(InternalError::bad_stage);
        reset_stage();
        break;
    }

    return interval_ms();
}

void DR_Failsafe::update_idle(uint32_t now_ms)
{
    if (_health.degraded()) {
        return;
    }

    const float alt = get_alt_above_home();
    if (alt >= _enable_alt) {
        gcs().send_text(DR_SEVERITY_NOTICE, "DR: enabled");
        _stage1_start_ms = now_ms;
        set_stage(Stage::MONITORING);
    } else if (_update_user) {
        gcs().send_text(DR_SEVERITY_NOTICE, "DR: waiting for alt:%d need:%d",
                        (int)floorf(alt), (int)floorf(_enable_alt));
    }
}

void DR_Failsafe::update_monitoring(uint32_t now_ms)
{
    float roll, pitch, yaw;
    _vehicle.get_attitude(roll, pitch, yaw);

    DR_AttitudeSample sample;
    sample.roll = degrees(roll);
    sample.pitch = degrees(pitch);
    sample.yaw = degrees(yaw);
    if (!_history.push(sample) && _update_user) {
        gcs().send_text(DR_SEVERITY_WARNING, "DR: out of memory, %u samples",
                        (unsigned)_history.size());
        LOGGER_WRITE_ERROR(LogErrorSubsystem::DEADRECKON_MEMORY, LogErrorCode::FAILED_TO_INITIALISE);
    }

    const DR_Mode::Number mode = _vehicle.get_mode();

    if (!_health.degraded()) {
        _saved_mode = mode;
        _have_saved_mode = true;
        return;
    }

    // the pilot keeps control in unprotected modes
    if (!DR_Mode::is_protected(mode)) {
        return;
    }

    if (!_vehicle.set_mode(DR_Mode::BLIND_GUIDED_MODE, ModeReason::DEADRECKON_FAILSAFE)) {
        if (_update_user) {
            gcs().send_text(DR_SEVERITY_NOTICE, "DR: failed to change to Guided_NoGPS mode");
        }
        return;
    }

    _target_yaw = sample.yaw;
    _stage2_start_ms = now_ms;
    set_stage(Stage::LEVELING);
}

bool DR_Failsafe::pilot_override()
{
    if (_vehicle.get_mode() == DR_Mode::BLIND_GUIDED_MODE) {
        return false;
    }
    gcs().send_text(DR_SEVERITY_NOTICE, "DR: pilot retook control");
    LOGGER_WRITE_EVENT(LogEvent::DR_PILOT_OVERRIDE);
    _stage = Stage::MONITORING;
    return true;
}

void DR_Failsafe::update_leveling(uint32_t now_ms)
{
    if (pilot_override()) {
        return;
    }

    const DR_AttitudeTarget target = DR_Failsafe_Command::level_target(_target_yaw);
    if (!_vehicle.set_target_angle_and_climbrate(target.roll_deg, target.pitch_deg, target.yaw_deg,
                                                 target.climb_rate_ms, false, 0.0f) &&
        _update_user) {
        gcs().send_text(DR_SEVERITY_EMERGENCY, "DR: failed to set attitude target");
    }

    if (DR_HAL::timeout_expired(_stage2_start_ms, now_ms, uint32_t(DR_FAILSAFE_LEVEL_TIME_MS))) {
        gcs().send_text(DR_SEVERITY_NOTICE, "DR: flying back with last known yaw");
        _stage3_start_ms = now_ms;
        set_stage(Stage::FLY_HOME_BLIND);
    }

    if (_update_user) {
        gcs().send_text(DR_SEVERITY_NOTICE, "DR: leveling vehicle");
    }
}

void DR_Failsafe::update_fly_home(uint32_t now_ms)
{
    if (pilot_override()) {
        return;
    }

    // the flight home may last as long as the flight out, plus what was
    // left over from an earlier failsafe
    const uint32_t elapsed_ms = now_ms - _stage3_start_ms;
    const uint32_t budget_ms = (_stage2_start_ms - _stage1_start_ms) + _time_left_ms;
    bool timed_out = elapsed_ms >= budget_ms;
    if (_fly_timeout > 0 && elapsed_ms >= uint32_t(_fly_timeout) * 1000U) {
        timed_out = true;
    }
    const uint32_t remaining_ms = timed_out ? 0 : budget_ms - elapsed_ms;

    DR_AttitudeTarget target;
    DR_Failsafe_Command::fly_home_target(_history, _target_yaw, _fly_angle, target);
    target.climb_rate_ms = DR_Failsafe_Command::climb_rate(get_alt_above_home(),
                                                           _climb_low_alt, _climb_mid_alt,
                                                           _climb_rate, _climb_trickle);

    if (_vehicle.set_target_angle_and_climbrate(target.roll_deg, target.pitch_deg, target.yaw_deg,
                                                target.climb_rate_ms, false, 0.0f)) {
        if (_update_user) {
            char msg[64];
            DR_Failsafe_Command::format_fly_home_status(msg, sizeof(msg), target,
                                                        !timed_out && _fly_timeout > 0,
                                                        remaining_ms);
            gcs().send_text(DR_SEVERITY_NOTICE, "%s", msg);
        }
    } else if (_update_user) {
        gcs().send_text(DR_SEVERITY_EMERGENCY, "DR: failed to set attitude target");
    }

    log_fly_home(target, remaining_ms, timed_out);

    if (_health.degraded() && !timed_out) {
        return;
    }

    if (!timed_out) {
        // resume the clock if the failsafe triggers again
        _time_left_ms = remaining_ms;
    }
    recover(timed_out);
}

/*
  leave the flight home, either because the vehicle recovered or
  because the time to fly home ran out
 */
void DR_Failsafe::recover(bool timed_out)
{
    LOGGER_WRITE_EVENT(timed_out ? LogEvent::DR_TIMEOUT : LogEvent::DR_RECOVERED);

    bool forced_fallback;
    const DR_Mode::Number mode = DR_Mode::select_recovery_mode(_next_mode,
                                                               _have_saved_mode, _saved_mode,
                                                               _health.degraded(),
                                                               forced_fallback);
    if (forced_fallback) {
        gcs().send_text(DR_SEVERITY_EMERGENCY, "DR: no usable next mode, falling back to RTL");
    }

    const ModeReason reason = forced_fallback ? ModeReason::DEADRECKON_FALLBACK : ModeReason::DEADRECKON_RECOVERY;
    if (!_vehicle.set_mode(mode, reason)) {
        gcs().send_text(DR_SEVERITY_EMERGENCY, "DR: failed to change to mode %u", (unsigned)mode);
        LOGGER_WRITE_ERROR(LogErrorSubsystem::FLIGHT_MODE, (uint8_t)mode);
        if (mode != DR_Mode::FALLBACK_MODE &&
            !_vehicle.set_mode(DR_Mode::FALLBACK_MODE, ModeReason::DEADRECKON_FALLBACK)) {
            gcs().send_text(DR_SEVERITY_EMERGENCY, "DR: failed to change to mode %u",
                            (unsigned)DR_Mode::FALLBACK_MODE);
            LOGGER_WRITE_ERROR(LogErrorSubsystem::FLIGHT_MODE, (uint8_t)DR_Mode::FALLBACK_MODE);
        }
    }

    set_stage(Stage::IDLE);
}

void DR_Failsafe::log_fly_home(const DR_AttitudeTarget &target, uint32_t time_left_ms, bool timed_out)
{
    DR_Logger *logger = DR_Logger::get_singleton();
    if (logger == nullptr) {
        return;
    }
    // @LoggerMessage: DRFH
    // @Description: Dead reckoning flight home target
    // @Field: TimeUS: Time since system startup
    // @Field: Roll: commanded roll
    // @Field: Pitch: commanded pitch
    // @Field: Yaw: commanded yaw
    // @Field: CRate: commanded climb rate
    // @Field: Hist: attitude samples left
    // @Field: TLeft: flight home time left
    // @Field: TO: true once the flight home timed out
    logger->Write("DRFH", "TimeUS,Roll,Pitch,Yaw,CRate,Hist,TLeft,TO", "QffffIIB",
                  DR_HAL::micros64(),
                  (double)target.roll_deg,
                  (double)target.pitch_deg,
                  (double)target.yaw_deg,
                  (double)target.climb_rate_ms,
                  _history.size(),
                  time_left_ms,
                  (uint8_t)timed_out);
}
