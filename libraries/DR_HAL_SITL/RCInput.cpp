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

#include "RCInput.h"

void HALSITL::RCInput::init()
{
    for (uint8_t i=0; i<SITL_RC_INPUT_CHANNELS; i++) {
        _pwm[i] = 1500;
    }
    // throttle low
    _pwm[2] = 1000;
    _failed = false;
}

bool HALSITL::RCInput::new_input()
{
    return !_failed;
}

uint8_t HALSITL::RCInput::num_channels()
{
    return _failed ? 0 : SITL_RC_INPUT_CHANNELS;
}

uint16_t HALSITL::RCInput::read(uint8_t ch)
{
    if (_failed || ch >= SITL_RC_INPUT_CHANNELS) {
        return 0;
    }
    return _pwm[ch];
}

void HALSITL::RCInput::set_pwm(uint8_t ch, uint16_t pwm)
{
    if (ch >= SITL_RC_INPUT_CHANNELS) {
        return;
    }
    if (pwm < RC_INPUT_MIN_PULSEWIDTH) {
        pwm = RC_INPUT_MIN_PULSEWIDTH;
    } else if (pwm > RC_INPUT_MAX_PULSEWIDTH) {
        pwm = RC_INPUT_MAX_PULSEWIDTH;
    }
    _pwm[ch] = pwm;
}
