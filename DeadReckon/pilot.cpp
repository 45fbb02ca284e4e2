/**
 * @file pilot.cpp
 * @brief Scripted pilot and fault injection
 *
 * @details The pilot climbs to SIM_CRUISE_ALT, holds SIM_OUT_ROLL and
 *          SIM_OUT_PITCH for SIM_OUT_TIME seconds and then centres the
 *          sticks. Independently of the flight, the RC link is cut at
 *          SIM_RC_FAIL_S, restored at SIM_RC_RECOVER_S, and the distress
 *          switch is raised at SIM_AUX_ON_S.
 */

#include <DR_HAL_SITL/DR_HAL_SITL.h>

#include "DeadReckon.h"

// pwm for a lean angle, the inverse of get_pilot_angle()
uint16_t DeadReckon::angle_to_pwm(float angle_deg)
{
    const float stick = constrain_float(angle_deg / PILOT_ANGLE_MAX_DEG, -1.0f, 1.0f);
    return uint16_t(1500 + roundf(stick * 500.0f));
}

void DeadReckon::set_sticks(uint16_t roll, uint16_t pitch, uint16_t throttle, uint16_t yaw)
{
    HALSITL::RCInput *rcin = HALSITL::RCInput::from(hal.rcin);
    rcin->set_pwm(0, roll);
    rcin->set_pwm(1, pitch);
    rcin->set_pwm(2, throttle);
    rcin->set_pwm(3, yaw);
}

void DeadReckon::update_pilot(uint32_t now_ms)
{
    HALSITL::RCInput *rcin = HALSITL::RCInput::from(hal.rcin);
    const uint32_t flight_ms = now_ms - start_ms;

    // fault injection
    if (!rc_failed_injected && g.sim_rc_fail_s >= 0 &&
        flight_ms >= uint32_t(g.sim_rc_fail_s) * 1000U) {
        rc_failed_injected = true;
        rcin->set_failed(true);
    }
    if (!rc_recovered_injected && g.sim_rc_recover_s >= 0 &&
        flight_ms >= uint32_t(g.sim_rc_recover_s) * 1000U) {
        rc_recovered_injected = true;
        rcin->set_failed(false);
    }
    if (!aux_injected && g.sim_aux_on_s >= 0 &&
        flight_ms >= uint32_t(g.sim_aux_on_s) * 1000U) {
        const uint8_t chan = failsafe.aux_chan();
        aux_injected = true;
        if (chan > 0) {
            rcin->set_pwm(chan - 1, RC_INPUT_MAX_PULSEWIDTH);
        }
    }

    switch (pilot_phase) {
    case PilotPhase::TAKEOFF:
        if (sim.alt < g.sim_cruise_alt) {
            set_sticks(1500, 1500, 1900, 1500);
            break;
        }
        pilot_phase = PilotPhase::OUTBOUND;
        outbound_start_ms = now_ms;
        gcs().send_text(DR_SEVERITY_INFO, "Pilot: outbound leg");
        FALLTHROUGH;

    case PilotPhase::OUTBOUND:
        if (now_ms - outbound_start_ms < uint32_t(g.sim_out_time) * 1000U) {
            set_sticks(angle_to_pwm(g.sim_out_roll), angle_to_pwm(g.sim_out_pitch), 1500, 1500);
            break;
        }
        pilot_phase = PilotPhase::HOVER;
        gcs().send_text(DR_SEVERITY_INFO, "Pilot: hovering");
        FALLTHROUGH;

    case PilotPhase::HOVER:
        set_sticks(1500, 1500, 1500, 1500);
        break;
    }
}
