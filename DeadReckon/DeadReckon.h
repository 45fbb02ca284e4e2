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
 * @file DeadReckon.h
 * @brief Simulated multicopter carrying the dead reckoning failsafe
 *
 * @details The vehicle couples a kinematic copter model to the failsafe
 *          library through the DR_Vehicle interface. A scripted pilot takes
 *          off, flies an outbound leg and then hovers. The script can cut
 *          the RC link or raise the distress switch at chosen times so that
 *          the failsafe can be watched flying the vehicle home.
 *
 *          Source files:
 *          - DeadReckon.cpp: main loop and the DR_Vehicle interface
 *          - Parameters.cpp: parameter table
 *          - radio.cpp: RC input and the radio failsafe
 *          - pilot.cpp: scripted pilot and fault injection
 *          - mode.cpp: flight modes
 *          - sim_model.cpp: airframe kinematics
 *          - Log.cpp: SIM log records
 *          - system.cpp: setup, arming and the end of flight summary
 */

#pragma once

#include <DR_HAL/DR_HAL.h>
#include <DR_Math/DR_Math.h>
#include <DR_Param/DR_Param.h>
#include <DR_Logger/DR_Logger.h>
#include <DR_Logger/DR_Logger_File.h>
#include <DR_Failsafe/DR_Failsafe.h>
#include <DR_Failsafe/DR_Vehicle.h>
#include <GCS/GCS.h>

#include "config.h"
#include "Parameters.h"
#include "GCS_DeadReckon.h"

class DeadReckon : public DR_HAL::HAL::Callbacks, public DR_Vehicle {
public:
    DeadReckon(void);

    CLASS_NO_COPY(DeadReckon);

    static const DR_Param::Info var_info[];

    // HAL::Callbacks
    void setup() override;
    void loop() override;

    // DR_Vehicle
    bool has_valid_rc_input() const override;
    bool get_rc_pwm(uint8_t chan, uint16_t &pwm) const override;
    bool is_armed() const override { return armed; }
    DR_Mode::Number get_mode() const override { return control_mode; }
    bool set_mode(DR_Mode::Number mode, ModeReason reason) override;
    void get_attitude(float &roll_rad, float &pitch_rad, float &yaw_rad) const override;
    bool get_relative_position_D_home(float &posD) const override;
    bool set_target_angle_and_climbrate(float roll_deg, float pitch_deg, float yaw_deg,
                                        float climb_rate_ms, bool use_yaw_rate,
                                        float yaw_rate_degs) override;

private:
    // Parameters.cpp
    void load_parameters(void);

    // radio.cpp
    void read_radio();
    void set_failsafe_radio(bool b);
    float get_pilot_angle(uint8_t chan) const;
    float get_pilot_climb_rate() const;
    float get_pilot_yaw_rate() const;

    // pilot.cpp
    void update_pilot(uint32_t now_ms);
    void set_sticks(uint16_t roll, uint16_t pitch, uint16_t throttle, uint16_t yaw);
    static uint16_t angle_to_pwm(float angle_deg);

    // mode.cpp
    bool mode_allowed(DR_Mode::Number mode) const;
    void mode_change_failed(DR_Mode::Number mode, const char *reason);
    void update_flight_mode(uint32_t now_ms, float dt);
    void run_pilot_mode(float dt);
    void run_guided_nogps(uint32_t now_ms);
    void run_rtl();
    void run_land();

    // sim_model.cpp
    void update_sim(float dt);
    void slew_attitude(float dt);
    float distance_from_home() const;

    // Log.cpp
    void Log_Write_Sim();

    // system.cpp
    void init_logging();
    void apply_param_overrides();
    void arm_motors();
    void disarm_motors();
    void print_summary();

    Parameters g;
    DR_Param param_loader;

    GCS_DeadReckon _gcs;
    DR_Logger logger;
    DR_Logger_File *log_backend;

    DR_Failsafe failsafe;

    bool armed;
    bool landed;
    uint32_t start_ms;

    DR_Mode::Number control_mode;
    ModeReason control_mode_reason;

    // radio
    uint32_t last_radio_update_ms;
    bool failsafe_radio;

    // scripted pilot
    enum class PilotPhase : uint8_t {
        TAKEOFF,
        OUTBOUND,
        HOVER,
    };
    PilotPhase pilot_phase;
    uint32_t outbound_start_ms;
    bool rc_failed_injected;
    bool rc_recovered_injected;
    bool aux_injected;

    // latest attitude target from the failsafe in GUIDED_NOGPS
    DR_AttitudeTarget guided_target;
    uint32_t guided_target_ms;

    // attitude and climb rate the airframe is asked to fly
    DR_AttitudeTarget desired;

    // airframe state, north-east frame relative to home
    struct {
        float pos_n;
        float pos_e;
        float vel_n;
        float vel_e;
        float alt;              // above home, up is positive
        float roll_deg;
        float pitch_deg;
        float yaw_deg;          // 0..360
        float climb_rate;
    } sim;

    // max distance from home reached while flying
    float max_distance;

    uint32_t last_failsafe_ms;
    uint32_t failsafe_interval_ms;
    uint32_t last_log_sim_ms;
    bool summary_printed;
};

extern const DR_HAL::HAL& hal;
extern DeadReckon deadreckon;
