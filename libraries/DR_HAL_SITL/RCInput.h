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

#include "DR_HAL_SITL_Namespace.h"

#define SITL_RC_INPUT_CHANNELS 16

/**
 * @class HALSITL::RCInput
 * @brief Simulated RC receiver
 *
 * @details Channel values are written by the simulation (or a test). A
 *          failed receiver delivers no frames and reports zero channels,
 *          matching the way a real receiver behaves once it loses the link.
 */
class HALSITL::RCInput : public DR_HAL::RCInput {
public:
    static RCInput *from(DR_HAL::RCInput *rcin) {
        return static_cast<HALSITL::RCInput*>(rcin);
    }

    void init() override;
    bool new_input() override;
    uint8_t num_channels() override;
    uint16_t read(uint8_t ch) override;
    const char *protocol() const override { return "SITL"; }

    // simulation side
    void set_pwm(uint8_t ch, uint16_t pwm);
    void set_failed(bool failed) { _failed = failed; }
    bool failed() const { return _failed; }

private:
    uint16_t _pwm[SITL_RC_INPUT_CHANNELS];
    bool _failed;
};
