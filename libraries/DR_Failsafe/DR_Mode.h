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
 * @file DR_Mode.h
 * @brief Flight mode numbers known to the dead reckoning failsafe
 *
 * @details Mode numbers are those of the multicopter firmware the failsafe
 *          runs on, so that DR_NEXT_MODE takes the same values as the
 *          FLTMODE parameters of the vehicle.
 */

#include <stdint.h>

class DR_Mode {
public:

    // Auto Pilot modes
    // ----------------
    enum class Number : uint8_t {
        STABILIZE =     0,  // manual airframe angle with manual throttle
        ACRO =          1,  // manual body-frame angular rate with manual throttle
        ALT_HOLD =      2,  // manual airframe angle with automatic throttle
        AUTO =          3,  // fully automatic waypoint control using mission commands
        GUIDED =        4,  // fully automatic fly to coordinate or fly at velocity/direction using GCS immediate commands
        LOITER =        5,  // automatic horizontal acceleration with automatic throttle
        RTL =           6,  // automatic return to launching point
        CIRCLE =        7,  // automatic circular flight with automatic throttle
        LAND =          9,  // automatic landing with horizontal position control
        DRIFT =        11,  // semi-autonomous position, yaw and throttle control
        SPORT =        13,  // manual earth-frame angular rate control with manual throttle
        FLIP =         14,  // automatically flip the vehicle on the roll axis
        AUTOTUNE =     15,  // automatically tune the vehicle's roll and pitch gains
        POSHOLD =      16,  // automatic position hold with manual override, with automatic throttle
        BRAKE =        17,  // full-brake using inertial/GPS system, no pilot input
        THROW =        18,  // throw to launch mode using inertial/GPS system, no pilot input
        AVOID_ADSB =   19,  // automatic avoidance of obstacles in the macro scale - e.g. full-sized aircraft
        GUIDED_NOGPS = 20,  // guided mode but only accepts attitude and altitude
        SMART_RTL =    21,  // SMART_RTL returns to home by retracing its steps
        FLOWHOLD  =    22,  // FLOWHOLD holds position with optical flow without rangefinder
        FOLLOW    =    23,  // follow attempts to follow another vehicle or ground station
        ZIGZAG    =    24,  // ZIGZAG mode is able to fly in a zigzag manner with predefined point A and point B
        SYSTEMID  =    25,  // System ID mode produces automated system identification signals in the controllers
        AUTOROTATE =   26,  // Autonomous autorotation
        AUTO_RTL =     27,  // Auto RTL, this is not a normal mode, AUTO will report this mode during a DO_LAND_START landing sequence
        TURTLE =       28,  // Flip over after crash
    };

    // mode the failsafe flies in while leveling and flying home
    static constexpr Number BLIND_GUIDED_MODE = Number::GUIDED_NOGPS;

    // mode used when no usable recovery mode is available
    static constexpr Number FALLBACK_MODE = Number::RTL;

    // true if mode is a valid mode number
    static bool from_int(int16_t value, Number &mode);

    // true if the failsafe may take over from this mode
    static bool is_protected(Number mode);

    // short printable name of the mode
    static const char *name(Number mode);

    /*
      choose the mode to restore once the vehicle recovers or the fly home
      budget expires. next_mode is the DR_NEXT_MODE parameter, negative to
      return to the mode saved before the failsafe. forced_fallback is set
      when the fallback mode had to be used instead.
     */
    static Number select_recovery_mode(int16_t next_mode,
                                       bool have_saved_mode, Number saved_mode,
                                       bool still_degraded,
                                       bool &forced_fallback);
};

// reasons for a mode change requested by the failsafe
enum class ModeReason : uint8_t {
    UNKNOWN = 0,
    RC_COMMAND = 1,
    GCS_COMMAND = 2,
    INITIALISED = 3,
    DEADRECKON_FAILSAFE = 4,
    DEADRECKON_RECOVERY = 5,
    DEADRECKON_FALLBACK = 6,
    MISSION_END = 7,
};
