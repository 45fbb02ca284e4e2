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

#include <stdint.h>

#include "DR_HAL_SITL_Namespace.h"

#define SITL_MAX_PARAM_OVERRIDES 32

/**
 * @struct HALSITL::SITL_Options
 * @brief Command line options of a SITL run
 *
 * @details Parsed by HAL_SITL::run() before the vehicle setup() callback so
 *          that the vehicle can apply parameter overrides and open its log.
 */
struct HALSITL::SITL_Options {
    struct ParamOverride {
        const char *name;
        float value;
    };

    float duration_s = 600.0f;
    const char *log_path = nullptr;
    bool quiet = false;
    uint8_t num_param_overrides = 0;
    ParamOverride param_overrides[SITL_MAX_PARAM_OVERRIDES];

    // parse NAME=VALUE, false if malformed or the table is full
    bool add_param_override(char *arg);
};

class HALSITL::HAL_SITL : public DR_HAL::HAL {
public:
    HAL_SITL();

    int run(int argc, char * const argv[], Callbacks* callbacks) const override;

    static const SITL_Options &get_options() { return _options; }

    // stop the main loop at the end of the current iteration
    static void request_exit() { _should_exit = true; }

private:
    bool parse_options(int argc, char * const argv[]) const;
    void usage(const char *progname) const;

    static SITL_Options _options;
    static bool _should_exit;
};
