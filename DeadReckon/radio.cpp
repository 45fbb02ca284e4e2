/**
 * @file radio.cpp
 * @brief RC input and the radio failsafe
 *
 * @details Channels are 1 roll, 2 pitch, 3 throttle and 4 yaw. A receiver
 *          that delivers no frame for RADIO_FS_TIMEOUT_MS puts the vehicle
 *          in radio failsafe. The vehicle itself takes no action on radio
 *          failsafe, it only stops reporting valid RC input so that the
 *          dead reckoning failsafe takes over.
 */

#include <stdlib.h>

#include "DeadReckon.h"

void DeadReckon::read_radio()
{
    const uint32_t tnow_ms = DR_HAL::millis();

    if (hal.rcin->new_input()) {
        last_radio_update_ms = tnow_ms;
        set_failsafe_radio(false);
        return;
    }

    // nothing to do if we are already in radio failsafe
    if (failsafe_radio) {
        return;
    }

    if (!DR_HAL::timeout_expired(last_radio_update_ms, tnow_ms, uint32_t(RADIO_FS_TIMEOUT_MS))) {
        return;
    }

    LOGGER_WRITE_ERROR(LogErrorSubsystem::RADIO, LogErrorCode::FAILSAFE_OCCURRED);
    set_failsafe_radio(true);
}

void DeadReckon::set_failsafe_radio(bool b)
{
    if (failsafe_radio == b) {
        return;
    }
    failsafe_radio = b;
    if (failsafe_radio) {
        gcs().send_text(DR_SEVERITY_WARNING, "Radio failsafe");
        LOGGER_WRITE_ERROR(LogErrorSubsystem::FAILSAFE_RADIO, LogErrorCode::FAILSAFE_OCCURRED);
    } else {
        gcs().send_text(DR_SEVERITY_WARNING, "Radio failsafe cleared");
        LOGGER_WRITE_ERROR(LogErrorSubsystem::FAILSAFE_RADIO, LogErrorCode::FAILSAFE_RESOLVED);
    }
}

// lean angle in degrees commanded by a stick, centred without radio
float DeadReckon::get_pilot_angle(uint8_t chan) const
{
    uint16_t pwm;
    if (!get_rc_pwm(chan, pwm)) {
        return 0;
    }
    return constrain_float((int16_t(pwm) - 1500) / 500.0f, -1.0f, 1.0f) * PILOT_ANGLE_MAX_DEG;
}

float DeadReckon::get_pilot_climb_rate() const
{
    uint16_t pwm;
    if (!get_rc_pwm(3, pwm)) {
        return 0;
    }
    const int16_t offset = int16_t(pwm) - 1500;
    if (abs(offset) <= PILOT_THROTTLE_DEADZONE) {
        return 0;
    }
    const float span = 500.0f - PILOT_THROTTLE_DEADZONE;
    const float stick = (offset > 0 ? offset - PILOT_THROTTLE_DEADZONE : offset + PILOT_THROTTLE_DEADZONE) / span;
    return constrain_float(stick, -1.0f, 1.0f) * PILOT_CLIMB_RATE_MAX_MS;
}

float DeadReckon::get_pilot_yaw_rate() const
{
    uint16_t pwm;
    if (!get_rc_pwm(4, pwm)) {
        return 0;
    }
    return constrain_float((int16_t(pwm) - 1500) / 500.0f, -1.0f, 1.0f) * PILOT_YAW_RATE_MAX_DEGS;
}
