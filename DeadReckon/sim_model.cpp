/**
 * @file sim_model.cpp
 * @brief Kinematic airframe model
 *
 * @details Roll and pitch slew towards the desired attitude at
 *          SIM_ANGLE_RATE_DEGS and the heading at SIM_YAW_RATE_DEGS. A lean
 *          angle accelerates the vehicle at g*tan(angle) in the body frame,
 *          opposed by linear drag, so a held attitude settles at a constant
 *          ground speed. The climb rate is followed directly. There is no
 *          wind.
 */

#include "DeadReckon.h"

// move value towards target by at most step
static float slew(float value, float target, float step)
{
    if (target > value + step) {
        return value + step;
    }
    if (target < value - step) {
        return value - step;
    }
    return target;
}

void DeadReckon::slew_attitude(float dt)
{
    sim.roll_deg = slew(sim.roll_deg, desired.roll_deg, SIM_ANGLE_RATE_DEGS * dt);
    sim.pitch_deg = slew(sim.pitch_deg, desired.pitch_deg, SIM_ANGLE_RATE_DEGS * dt);

    // shortest way round to the desired heading
    const float yaw_error = wrap_180(desired.yaw_deg - sim.yaw_deg);
    sim.yaw_deg = wrap_360(sim.yaw_deg + slew(0, yaw_error, SIM_YAW_RATE_DEGS * dt));
}

void DeadReckon::update_sim(float dt)
{
    slew_attitude(dt);

    // vertical
    sim.climb_rate = desired.climb_rate_ms;
    if (!armed) {
        sim.climb_rate = 0;
    }
    sim.alt += sim.climb_rate * dt;
    if (sim.alt <= 0) {
        sim.alt = 0;
        sim.climb_rate = 0;
    }
    landed = is_zero(sim.alt) && !is_positive(desired.climb_rate_ms);

    // horizontal
    if (landed) {
        sim.vel_n = 0;
        sim.vel_e = 0;
    } else if (control_mode != DR_Mode::Number::RTL) {
        // nose down accelerates forward, right roll accelerates right
        const float accel_fwd = -GRAVITY_MSS * tanf(radians(sim.pitch_deg));
        const float accel_right = GRAVITY_MSS * tanf(radians(sim.roll_deg));
        const float yaw_rad = radians(sim.yaw_deg);
        const float cos_yaw = cosf(yaw_rad);
        const float sin_yaw = sinf(yaw_rad);

        float drag = SIM_DRAG_COEF;
        if (control_mode == DR_Mode::Number::LOITER &&
            is_zero(desired.roll_deg) && is_zero(desired.pitch_deg)) {
            drag += SIM_LOITER_BRAKE_COEF;
        }

        const float accel_n = accel_fwd * cos_yaw - accel_right * sin_yaw - drag * sim.vel_n;
        const float accel_e = accel_fwd * sin_yaw + accel_right * cos_yaw - drag * sim.vel_e;
        sim.vel_n += accel_n * dt;
        sim.vel_e += accel_e * dt;
    }

    sim.pos_n += sim.vel_n * dt;
    sim.pos_e += sim.vel_e * dt;

    const float dist = distance_from_home();
    if (dist > max_distance) {
        max_distance = dist;
    }
}

float DeadReckon::distance_from_home() const
{
    return norm(sim.pos_n, sim.pos_e);
}
