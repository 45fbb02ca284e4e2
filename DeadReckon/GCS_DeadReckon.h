/**
 * @file GCS_DeadReckon.h
 * @brief Status text output of the simulated copter
 *
 * @details There is no telemetry link in the simulation. Status text is
 *          printed to stdout with the simulated time and severity, unless
 *          the run was started with --quiet. Every message still goes to
 *          the flight log.
 */

#pragma once

#include <GCS/GCS.h>

class GCS_DeadReckon : public GCS
{
public:
    GCS_DeadReckon() : _quiet(false) {}

    void set_quiet(bool quiet) { _quiet = quiet; }

protected:
    void send_statustext(DR_Severity severity, const char *text) override;

private:
    bool _quiet;
};
