/**
 * @file Parameters.h
 * @brief Parameters of the simulated dead reckoning copter
 *
 * @details The SIM_ parameters describe the scripted flight: the outbound
 *          leg the pilot flies and when the RC link and the distress switch
 *          fail. The failsafe itself is configured through its DR_ group.
 *          All of them can be set with --param NAME=VALUE.
 */

#pragma once

#include <DR_Param/DR_Param.h>

class Parameters {
public:
    // bump when the meaning of a parameter changes
    static const uint16_t k_format_version = 1;

    DR_Int16        format_version;

    // flight mode the pilot takes off in
    DR_Int8         sim_pilot_mode;

    // outbound leg
    DR_Float        sim_cruise_alt;
    DR_Float        sim_out_roll;
    DR_Float        sim_out_pitch;
    DR_Float        sim_out_hdg;
    DR_Int16        sim_out_time;

    // fault injection, seconds since boot, negative for never
    DR_Int16        sim_rc_fail_s;
    DR_Int16        sim_rc_recover_s;
    DR_Int16        sim_aux_on_s;

    Parameters() {}
};
