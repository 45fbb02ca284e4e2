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

#include "DR_Failsafe_Health.h"

#include <DR_HAL/DR_HAL.h>
#include <DR_Logger/DR_Logger.h>
#include <GCS/GCS.h>

DR_Failsafe_Health::DR_Failsafe_Health()
{
    reset();
}

void DR_Failsafe_Health::reset()
{
    _rc_bad = false;
    _aux_bad = false;
    _degraded = true;
    _recovery_pending = false;
    _recovery_start_ms = 0;
}

DR_Failsafe_Health::Transition DR_Failsafe_Health::update(bool rc_valid, bool aux_distress, uint32_t now_ms)
{
    _rc_bad = !rc_valid;
    _aux_bad = aux_distress;
    const bool bad_now = _rc_bad || _aux_bad;

    if (!_degraded) {
        if (!bad_now) {
            return Transition::NONE;
        }
        _degraded = true;
        _recovery_pending = false;
        GCS_SEND_TEXT(DR_SEVERITY_EMERGENCY, "DR: RC and/or something bad");
        LOGGER_WRITE_ERROR(LogErrorSubsystem::FAILSAFE_DEADRECKON, LogErrorCode::FAILSAFE_OCCURRED);
        return Transition::DEGRADED;
    }

    if (bad_now) {
        // any bad observation restarts the recovery window
        _recovery_pending = false;
        return Transition::NONE;
    }

    if (!_recovery_pending) {
        _recovery_pending = true;
        _recovery_start_ms = now_ms;
    }
    if (!DR_HAL::timeout_expired(_recovery_start_ms, now_ms, uint32_t(DR_FAILSAFE_RECOVERY_DELAY_MS))) {
        return Transition::NONE;
    }

    _degraded = false;
    _recovery_pending = false;
    GCS_SEND_TEXT(DR_SEVERITY_EMERGENCY, "DR: RC and/or something recovered");
    LOGGER_WRITE_ERROR(LogErrorSubsystem::FAILSAFE_DEADRECKON, LogErrorCode::FAILSAFE_RESOLVED);
    return Transition::RECOVERED;
}
