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

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "DR_HAL_SITL.h"

using namespace HALSITL;

static RCInput sitlRCInput;
static Scheduler sitlScheduler;

HALSITL::SITL_Options HAL_SITL::_options;
bool HAL_SITL::_should_exit;

bool SITL_Options::add_param_override(char *arg)
{
    if (num_param_overrides >= SITL_MAX_PARAM_OVERRIDES) {
        return false;
    }
    char *eq = strchr(arg, '=');
    if (eq == nullptr || eq == arg) {
        return false;
    }
    *eq = 0;
    char *endptr;
    const float value = strtof(eq+1, &endptr);
    if (endptr == eq+1 || *endptr != 0) {
        return false;
    }
    param_overrides[num_param_overrides].name = arg;
    param_overrides[num_param_overrides].value = value;
    num_param_overrides++;
    return true;
}

HAL_SITL::HAL_SITL() :
    DR_HAL::HAL(
        &sitlRCInput,
        &sitlScheduler)
{
    sitlScheduler.init();
    sitlRCInput.init();
}

void HAL_SITL::usage(const char *progname) const
{
    printf("Options:\n"
           "\t--help|-h               display this help information\n"
           "\t--duration|-d SECONDS   simulated flight time (default %.0f)\n"
           "\t--param|-P NAME=VALUE   set a parameter before setup\n"
           "\t--log|-l FILE           write the flight log to FILE\n"
           "\t--quiet|-q              do not print status text\n",
           _options.duration_s);
    printf("Usage: %s [options]\n", progname);
}

bool HAL_SITL::parse_options(int argc, char * const argv[]) const
{
    static const struct option options[] = {
        {"help",     false, nullptr, 'h'},
        {"duration", true,  nullptr, 'd'},
        {"param",    true,  nullptr, 'P'},
        {"log",      true,  nullptr, 'l'},
        {"quiet",    false, nullptr, 'q'},
        {nullptr,    false, nullptr, 0}
    };

    int opt;
    optind = 1;
    while ((opt = getopt_long(argc, argv, "hd:P:l:q", options, nullptr)) != -1) {
        switch (opt) {
        case 'd': {
            char *endptr;
            _options.duration_s = strtof(optarg, &endptr);
            if (*endptr != 0 || _options.duration_s <= 0) {
                fprintf(stderr, "Bad duration '%s'\n", optarg);
                return false;
            }
            break;
        }
        case 'P':
            if (!_options.add_param_override(optarg)) {
                fprintf(stderr, "Bad parameter override '%s'\n", optarg);
                return false;
            }
            break;
        case 'l':
            _options.log_path = optarg;
            break;
        case 'q':
            _options.quiet = true;
            break;
        case 'h':
        default:
            usage(argv[0]);
            return false;
        }
    }
    return true;
}

int HAL_SITL::run(int argc, char * const argv[], Callbacks* callbacks) const
{
    if (!parse_options(argc, argv)) {
        return 1;
    }

    callbacks->setup();
    scheduler->set_system_initialized();

    const uint64_t end_ms = uint64_t(_options.duration_s * 1000.0f);
    while (!_should_exit && DR_HAL::millis64() < end_ms) {
        callbacks->loop();
    }
    return 0;
}

static HAL_SITL hal_sitl;

const DR_HAL::HAL& DR_HAL::get_HAL()
{
    return hal_sitl;
}

DR_HAL::HAL& DR_HAL::get_HAL_mutable()
{
    return hal_sitl;
}
