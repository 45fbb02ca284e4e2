/**
 * @file Parameters.cpp
 * @brief Parameter table of the simulated dead reckoning copter
 *
 * @details GSCALAR declares a scalar held in the Parameters object and
 *          GOBJECT a library object with its own var_info group. Names are
 *          at most 16 characters. Defaults are applied by load_parameters()
 *          before the --param overrides.
 */

#include "DeadReckon.h"

#define GSCALAR(v, name, def) DR_VARINFO_SCALAR(deadreckon.g.v, name, def)
#define GOBJECT(v, name, class) DR_VARINFO_OBJECT(deadreckon.v, name, class)

const DR_Param::Info DeadReckon::var_info[] = {
    // @Param: FORMAT_VERSION
    // @DisplayName: Parameter format version
    // @Description: Incremented when the meaning of a parameter changes
    // @User: Advanced
    GSCALAR(format_version, "FORMAT_VERSION",   Parameters::k_format_version),

    // @Param: SIM_PILOT_MODE
    // @DisplayName: Pilot flight mode
    // @Description: Flight mode the scripted pilot takes off and flies the outbound leg in
    // @Values: 0:Stabilize,2:AltHold,5:Loiter
    // @User: Standard
    GSCALAR(sim_pilot_mode, "SIM_PILOT_MODE",   5),

    // @Param: SIM_CRUISE_ALT
    // @DisplayName: Cruise altitude
    // @Description: Altitude above home the pilot climbs to before the outbound leg
    // @Units: m
    // @Range: 1 200
    // @User: Standard
    GSCALAR(sim_cruise_alt, "SIM_CRUISE_ALT",   30),

    // @Param: SIM_OUT_ROLL
    // @DisplayName: Outbound roll
    // @Description: Roll angle held by the pilot on the outbound leg
    // @Units: deg
    // @Range: -30 30
    // @User: Standard
    GSCALAR(sim_out_roll,   "SIM_OUT_ROLL",     0),

    // @Param: SIM_OUT_PITCH
    // @DisplayName: Outbound pitch
    // @Description: Pitch angle held by the pilot on the outbound leg, negative is nose down
    // @Units: deg
    // @Range: -30 30
    // @User: Standard
    GSCALAR(sim_out_pitch,  "SIM_OUT_PITCH",    -10),

    // @Param: SIM_OUT_HDG
    // @DisplayName: Outbound heading
    // @Description: Heading of the vehicle at takeoff and on the outbound leg
    // @Units: deg
    // @Range: 0 360
    // @User: Standard
    GSCALAR(sim_out_hdg,    "SIM_OUT_HDG",      45),

    // @Param: SIM_OUT_TIME
    // @DisplayName: Outbound time
    // @Description: Duration of the outbound leg. The pilot hovers afterwards
    // @Units: s
    // @Range: 0 600
    // @User: Standard
    GSCALAR(sim_out_time,   "SIM_OUT_TIME",     60),

    // @Param: SIM_RC_FAIL_S
    // @DisplayName: RC failure time
    // @Description: Time since boot at which the RC link is lost. -1 to never lose it
    // @Units: s
    // @User: Standard
    GSCALAR(sim_rc_fail_s,  "SIM_RC_FAIL_S",    70),

    // @Param: SIM_RC_RECOVER_S
    // @DisplayName: RC recovery time
    // @Description: Time since boot at which the RC link comes back. -1 to never recover
    // @Units: s
    // @User: Standard
    GSCALAR(sim_rc_recover_s, "SIM_RC_RECOVER_S", -1),

    // @Param: SIM_AUX_ON_S
    // @DisplayName: Distress switch time
    // @Description: Time since boot at which the pilot raises the distress switch. -1 for never
    // @Units: s
    // @User: Standard
    GSCALAR(sim_aux_on_s,   "SIM_AUX_ON_S",     -1),

    // @Group: DR_
    // @Path: ../libraries/DR_Failsafe/DR_Failsafe.cpp
    GOBJECT(failsafe,       "DR_",              DR_Failsafe),

    DR_VAREND
};

void DeadReckon::load_parameters(void)
{
    DR_Param::load_defaults();
}
