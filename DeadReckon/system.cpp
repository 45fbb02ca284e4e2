/**
 * @file system.cpp
 * @brief Startup, arming and the end of flight summary
 */

#include <stdio.h>

#include <DR_HAL_SITL/DR_HAL_SITL.h>

#include "DeadReckon.h"

void DeadReckon::setup()
{
    const HALSITL::SITL_Options &options = HALSITL::HAL_SITL::get_options();

    _gcs.set_quiet(options.quiet);

    load_parameters();
    apply_param_overrides();

    init_logging();

    // the failsafe starts over with the parameters now in place
    failsafe.init();

    start_ms = DR_HAL::millis();
    sim.yaw_deg = wrap_360(g.sim_out_hdg);
    desired.yaw_deg = sim.yaw_deg;

    // the pilot only flies the manual modes
    DR_Mode::Number mode;
    if (!DR_Mode::from_int(g.sim_pilot_mode, mode) ||
        (mode != DR_Mode::Number::STABILIZE &&
         mode != DR_Mode::Number::ALT_HOLD &&
         mode != DR_Mode::Number::LOITER) ||
        !set_mode(mode, ModeReason::INITIALISED)) {
        gcs().send_text(DR_SEVERITY_WARNING, "Bad SIM_PILOT_MODE %d, using LOITER", int(g.sim_pilot_mode));
        set_mode(DR_Mode::Number::LOITER, ModeReason::INITIALISED);
    }

    arm_motors();
}

void DeadReckon::apply_param_overrides()
{
    const HALSITL::SITL_Options &options = HALSITL::HAL_SITL::get_options();
    for (uint8_t i=0; i<options.num_param_overrides; i++) {
        const HALSITL::SITL_Options::ParamOverride &p = options.param_overrides[i];
        if (!DR_Param::set_by_name(p.name, p.value)) {
            gcs().send_text(DR_SEVERITY_WARNING, "Unknown parameter %s", p.name);
        }
    }
}

void DeadReckon::init_logging()
{
    const char *path = HALSITL::HAL_SITL::get_options().log_path;
    if (path == nullptr) {
        return;
    }
    log_backend = NEW_NOTHROW DR_Logger_File(path);
    if (log_backend == nullptr) {
        gcs().send_text(DR_SEVERITY_ERROR, "Logging: out of memory");
        return;
    }
    if (!logger.init(log_backend)) {
        gcs().send_text(DR_SEVERITY_ERROR, "Logging: unable to open %s", path);
        LOGGER_WRITE_ERROR(LogErrorSubsystem::MAIN, LogErrorCode::FAILED_TO_INITIALISE);
    }
}

void DeadReckon::arm_motors()
{
    if (armed) {
        return;
    }
    armed = true;
    landed = true;
    // home is where we arm
    sim.pos_n = 0;
    sim.pos_e = 0;
    sim.alt = 0;
    max_distance = 0;
    LOGGER_WRITE_EVENT(LogEvent::ARMED);
    gcs().send_text(DR_SEVERITY_INFO, "Arming motors");
}

void DeadReckon::disarm_motors()
{
    if (!armed) {
        return;
    }
    armed = false;
    LOGGER_WRITE_EVENT(LogEvent::DISARMED);
    gcs().send_text(DR_SEVERITY_INFO, "Disarming motors");
}

void DeadReckon::print_summary()
{
    if (summary_printed) {
        return;
    }
    summary_printed = true;
    logger.flush();

    printf("Flight summary:\n"
           "  time         %.1f s\n"
           "  mode         %s\n"
           "  armed        %s\n"
           "  altitude     %.1f m\n"
           "  max distance %.1f m\n"
           "  from home    %.1f m\n",
           (double)(DR_HAL::millis() * 0.001f),
           DR_Mode::name(control_mode),
           armed ? "yes" : "no",
           (double)sim.alt,
           (double)max_distance,
           (double)distance_from_home());
}
