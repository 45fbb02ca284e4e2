#include <stdio.h>

#include <DR_HAL/DR_HAL.h>

#include "GCS_DeadReckon.h"

static const char *severity_name(DR_Severity severity)
{
    switch (severity) {
    case DR_SEVERITY_EMERGENCY:
        return "EMERG";
    case DR_SEVERITY_ALERT:
        return "ALERT";
    case DR_SEVERITY_CRITICAL:
        return "CRIT";
    case DR_SEVERITY_ERROR:
        return "ERROR";
    case DR_SEVERITY_WARNING:
        return "WARN";
    case DR_SEVERITY_NOTICE:
        return "NOTICE";
    case DR_SEVERITY_INFO:
        return "INFO";
    case DR_SEVERITY_DEBUG:
        return "DEBUG";
    }
    return "?";
}

void GCS_DeadReckon::send_statustext(DR_Severity severity, const char *text)
{
    if (_quiet) {
        return;
    }
    printf("%8.1f %-6s %s\n", (double)(DR_HAL::millis() * 0.001f), severity_name(severity), text);
}
