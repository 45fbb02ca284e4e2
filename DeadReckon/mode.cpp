/**
 * @file mode.cpp
 * @brief Flight modes of the simulated copter
 *
 * @details The simulation flies a subset of the copter modes:
 *          - STABILIZE, ALT_HOLD, LOITER: pilot lean angles and climb rate,
 *            LOITER also brakes with the sticks centred
 *          - GUIDED_NOGPS: attitude and climb rate targets from
 *            set_target_angle_and_climbrate()
 *          - RTL: straight line back to home at RTL_SPEED_MS, then land
 *          - LAND: descend at LAND_SPEED_MS and disarm on touchdown
 *
 *          Requests for any other mode fail and leave the mode unchanged.
 */

#include "DeadReckon.h"

static const DR_Mode::Number supported_modes[] = {
    DR_Mode::Number::STABILIZE,
    DR_Mode::Number::ALT_HOLD,
    DR_Mode::Number::LOITER,
    DR_Mode::Number::GUIDED_NOGPS,
    DR_Mode::Number::RTL,
    DR_Mode::Number::LAND,
};

bool DeadReckon::mode_allowed(DR_Mode::Number mode) const
{
    for (uint8_t i=0; i<ARRAY_SIZE(supported_modes); i++) {
        if (supported_modes[i] == mode) {
            return true;
        }
    }
    return false;
}

void DeadReckon::mode_change_failed(DR_Mode::Number mode, const char *reason)
{
    gcs().send_text(DR_SEVERITY_WARNING, "Mode change to %s failed: %s", DR_Mode::name(mode), reason);
    LOGGER_WRITE_ERROR(LogErrorSubsystem::FLIGHT_MODE, uint8_t(mode));
}

/*
  change the flight mode. Returns false if the mode is not flown by
  this vehicle, in which case the current mode is kept.
 */
bool DeadReckon::set_mode(DR_Mode::Number mode, ModeReason reason)
{
    // return immediately if we are already in the desired mode
    if (mode == control_mode) {
        control_mode_reason = reason;
        return true;
    }

    if (!mode_allowed(mode)) {
        mode_change_failed(mode, "unsupported mode");
        return false;
    }

    if (mode == DR_Mode::Number::GUIDED_NOGPS) {
        // hold the current attitude until the first target arrives
        guided_target.roll_deg = sim.roll_deg;
        guided_target.pitch_deg = sim.pitch_deg;
        guided_target.yaw_deg = sim.yaw_deg;
        guided_target.climb_rate_ms = 0;
        guided_target_ms = DR_HAL::millis();
    }

    control_mode = mode;
    control_mode_reason = reason;
    logger.Write_Mode(uint8_t(control_mode), uint8_t(reason));
    gcs().send_text(DR_SEVERITY_INFO, "Mode %s", DR_Mode::name(mode));
    return true;
}

void DeadReckon::update_flight_mode(uint32_t now_ms, float dt)
{
    if (!armed) {
        desired.roll_deg = 0;
        desired.pitch_deg = 0;
        desired.yaw_deg = sim.yaw_deg;
        desired.climb_rate_ms = 0;
        return;
    }

    switch (control_mode) {
    case DR_Mode::Number::GUIDED_NOGPS:
        run_guided_nogps(now_ms);
        break;
    case DR_Mode::Number::RTL:
        run_rtl();
        break;
    case DR_Mode::Number::LAND:
        run_land();
        break;
    default:
        run_pilot_mode(dt);
        break;
    }
}

void DeadReckon::run_pilot_mode(float dt)
{
    desired.roll_deg = get_pilot_angle(1);
    // stick forward is low pwm and nose down
    desired.pitch_deg = get_pilot_angle(2);
    desired.yaw_deg = wrap_360(desired.yaw_deg + get_pilot_yaw_rate() * dt);
    desired.climb_rate_ms = get_pilot_climb_rate();
}

void DeadReckon::run_guided_nogps(uint32_t now_ms)
{
    // level off if the targets stop arriving
    if (DR_HAL::timeout_expired(guided_target_ms, now_ms, uint32_t(GUIDED_ANGLE_TIMEOUT_MS))) {
        desired.roll_deg = 0;
        desired.pitch_deg = 0;
        desired.climb_rate_ms = 0;
        return;
    }
    desired = guided_target;
}

/*
  RTL flies at a fixed ground speed straight to home using the true
  position of the simulation, then lands
 */
void DeadReckon::run_rtl()
{
    const float dist = distance_from_home();
    if (dist <= RTL_ACCEPT_RADIUS_M) {
        set_mode(DR_Mode::Number::LAND, ModeReason::MISSION_END);
        return;
    }
    sim.vel_n = -sim.pos_n / dist * RTL_SPEED_MS;
    sim.vel_e = -sim.pos_e / dist * RTL_SPEED_MS;
    desired.roll_deg = 0;
    desired.pitch_deg = 0;
    desired.yaw_deg = wrap_360(degrees(atan2f(-sim.pos_e, -sim.pos_n)));
    desired.climb_rate_ms = 0;
}

void DeadReckon::run_land()
{
    desired.roll_deg = 0;
    desired.pitch_deg = 0;
    desired.climb_rate_ms = -LAND_SPEED_MS;
    if (landed) {
        disarm_motors();
    }
}
