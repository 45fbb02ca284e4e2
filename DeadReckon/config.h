/**
 * @file config.h
 * @brief Compile time defaults of the simulated dead reckoning copter
 *
 * @details Each value may be overridden on the compiler command line. The
 *          run time tunables of the scenario live in Parameters.cpp.
 */

#pragma once

//////////////////////////////////////////////////////////////////////////////
// Main loop
//
#ifndef MAIN_LOOP_MS
 # define MAIN_LOOP_MS                  10      // simulation step
#endif

#ifndef LOG_SIM_INTERVAL_MS
 # define LOG_SIM_INTERVAL_MS           100     // SIM log record rate
#endif

//////////////////////////////////////////////////////////////////////////////
// Radio
//
#ifndef RADIO_FS_TIMEOUT_MS
 # define RADIO_FS_TIMEOUT_MS           500     // no frames for this long is a radio failsafe
#endif

#ifndef PILOT_ANGLE_MAX_DEG
 # define PILOT_ANGLE_MAX_DEG           30.0f   // lean angle at full stick
#endif

#ifndef PILOT_CLIMB_RATE_MAX_MS
 # define PILOT_CLIMB_RATE_MAX_MS       2.5f    // climb rate at full throttle
#endif

#ifndef PILOT_YAW_RATE_MAX_DEGS
 # define PILOT_YAW_RATE_MAX_DEGS       60.0f
#endif

#ifndef PILOT_THROTTLE_DEADZONE
 # define PILOT_THROTTLE_DEADZONE       50      // pwm either side of mid stick
#endif

//////////////////////////////////////////////////////////////////////////////
// Airframe model
//
#ifndef SIM_ANGLE_RATE_DEGS
 # define SIM_ANGLE_RATE_DEGS           90.0f   // roll and pitch slew rate
#endif

#ifndef SIM_YAW_RATE_DEGS
 # define SIM_YAW_RATE_DEGS             45.0f   // heading slew rate
#endif

#ifndef SIM_DRAG_COEF
 # define SIM_DRAG_COEF                 0.3f    // linear drag, 1/s
#endif

#ifndef SIM_LOITER_BRAKE_COEF
 # define SIM_LOITER_BRAKE_COEF         1.0f    // extra braking with sticks centred in LOITER
#endif

//////////////////////////////////////////////////////////////////////////////
// Guided, RTL and Land
//
#ifndef GUIDED_ANGLE_TIMEOUT_MS
 # define GUIDED_ANGLE_TIMEOUT_MS       3000    // level off without fresh attitude targets
#endif

#ifndef RTL_SPEED_MS
 # define RTL_SPEED_MS                  5.0f
#endif

#ifndef RTL_ACCEPT_RADIUS_M
 # define RTL_ACCEPT_RADIUS_M           2.0f
#endif

#ifndef LAND_SPEED_MS
 # define LAND_SPEED_MS                 1.0f
#endif
