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

#include "DR_Mode.h"

constexpr DR_Mode::Number DR_Mode::BLIND_GUIDED_MODE;
constexpr DR_Mode::Number DR_Mode::FALLBACK_MODE;

/*
  modes dead reckoning may be activated from. Remove a mode from this
  table to let the pilot keep control in it during a failsafe.
 */
static const DR_Mode::Number protected_modes[] = {
    DR_Mode::Number::STABILIZE,
    DR_Mode::Number::ALT_HOLD,
    DR_Mode::Number::AUTO,
    DR_Mode::Number::GUIDED,
    DR_Mode::Number::LOITER,
    DR_Mode::Number::RTL,
    DR_Mode::Number::CIRCLE,
    DR_Mode::Number::LAND,
    DR_Mode::Number::POSHOLD,
    DR_Mode::Number::BRAKE,
    DR_Mode::Number::SMART_RTL,
    DR_Mode::Number::AUTO_RTL,
};

static const struct {
    DR_Mode::Number mode;
    const char *name;
} mode_names[] = {
    { DR_Mode::Number::STABILIZE,    "STABILIZE" },
    { DR_Mode::Number::ACRO,         "ACRO" },
    { DR_Mode::Number::ALT_HOLD,     "ALT_HOLD" },
    { DR_Mode::Number::AUTO,         "AUTO" },
    { DR_Mode::Number::GUIDED,       "GUIDED" },
    { DR_Mode::Number::LOITER,       "LOITER" },
    { DR_Mode::Number::RTL,          "RTL" },
    { DR_Mode::Number::CIRCLE,       "CIRCLE" },
    { DR_Mode::Number::LAND,         "LAND" },
    { DR_Mode::Number::DRIFT,        "DRIFT" },
    { DR_Mode::Number::SPORT,        "SPORT" },
    { DR_Mode::Number::FLIP,         "FLIP" },
    { DR_Mode::Number::AUTOTUNE,     "AUTOTUNE" },
    { DR_Mode::Number::POSHOLD,      "POSHOLD" },
    { DR_Mode::Number::BRAKE,        "BRAKE" },
    { DR_Mode::Number::THROW,        "THROW" },
    { DR_Mode::Number::AVOID_ADSB,   "AVOID_ADSB" },
    { DR_Mode::Number::GUIDED_NOGPS, "GUIDED_NOGPS" },
    { DR_Mode::Number::SMART_RTL,    "SMART_RTL" },
    { DR_Mode::Number::FLOWHOLD,     "FLOWHOLD" },
    { DR_Mode::Number::FOLLOW,       "FOLLOW" },
    { DR_Mode::Number::ZIGZAG,       "ZIGZAG" },
    { DR_Mode::Number::SYSTEMID,     "SYSTEMID" },
    { DR_Mode::Number::AUTOROTATE,   "AUTOROTATE" },
    { DR_Mode::Number::AUTO_RTL,     "AUTO_RTL" },
    { DR_Mode::Number::TURTLE,       "TURTLE" },
};

bool DR_Mode::from_int(int16_t value, Number &mode)
{
    for (const auto &entry : mode_names) {
        if ((int16_t)entry.mode == value) {
            mode = entry.mode;
            return true;
        }
    }
    return false;
}

bool DR_Mode::is_protected(Number mode)
{
    for (const Number protected_mode : protected_modes) {
        if (mode == protected_mode) {
            return true;
        }
    }
    return false;
}

const char *DR_Mode::name(Number mode)
{
    for (const auto &entry : mode_names) {
        if (entry.mode == mode) {
            return entry.name;
        }
    }
    return "?";
}

DR_Mode::Number DR_Mode::select_recovery_mode(int16_t next_mode,
                                              bool have_saved_mode, Number saved_mode,
                                              bool still_degraded,
                                              bool &forced_fallback)
{
    bool have_mode = have_saved_mode;
    Number mode = saved_mode;

    if (next_mode >= 0) {
        // an unknown mode number is treated like no mode at all
        have_mode = from_int(next_mode, mode);
    }

    forced_fallback = !have_mode || still_degraded;
    if (forced_fallback) {
        return FALLBACK_MODE;
    }
    return mode;
}
