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

#include "DR_HAL_Namespace.h"

#define RC_INPUT_MIN_PULSEWIDTH 900
#define RC_INPUT_MAX_PULSEWIDTH 2100

/**
 * @class DR_HAL::RCInput
 * @brief Radio control receiver input
 *
 * @details Channels are zero indexed at this level. A receiver that has lost
 *          its link stops reporting new input and reports zero channels;
 *          callers decide when the link is considered lost.
 */
class DR_HAL::RCInput {
public:
    virtual void init() = 0;

    /// true when a new frame arrived since the last call
    virtual bool new_input(void) = 0;

    /// number of channels in the last frame, zero without a link
    virtual uint8_t num_channels() = 0;

    /// pulse width of channel ch in microseconds, zero when not available
    virtual uint16_t read(uint8_t ch) = 0;

    virtual int16_t get_rssi(void) { return -1; }
    virtual const char *protocol() const { return nullptr; }
};
