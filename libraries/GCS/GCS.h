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

/**
 * @file GCS.h
 * @brief Ground station text messages
 *
 * @details Status text is the only channel through which the vehicle talks to
 *          its operator. Messages are limited to GCS_STATUSTEXT_LEN
 *          characters, longer text is truncated. Every message is also
 *          recorded in the flight log as a MSG record. The vehicle provides
 *          the GCS implementation that delivers the text.
 */

#include <stdarg.h>
#include <stdint.h>

#include <DR_HAL/DR_HAL_Macros.h>

#define GCS_STATUSTEXT_LEN 50

// severities follow the usual 0 (most severe) .. 7 scale
enum DR_Severity : uint8_t {
    DR_SEVERITY_EMERGENCY = 0,
    DR_SEVERITY_ALERT     = 1,
    DR_SEVERITY_CRITICAL  = 2,
    DR_SEVERITY_ERROR     = 3,
    DR_SEVERITY_WARNING   = 4,
    DR_SEVERITY_NOTICE    = 5,
    DR_SEVERITY_INFO      = 6,
    DR_SEVERITY_DEBUG     = 7,
};

class GCS
{
public:
    GCS();
    virtual ~GCS();

    CLASS_NO_COPY(GCS);

    static GCS *get_singleton() {
        return _singleton;
    }

    void send_text(DR_Severity severity, const char *fmt, ...) FMT_PRINTF(3, 4);
    void send_textv(DR_Severity severity, const char *fmt, va_list arg_list);

    uint32_t num_statustext_sent() const { return _statustext_sent; }

protected:
    // deliver one formatted, nul terminated message
    virtual void send_statustext(DR_Severity severity, const char *text) = 0;

private:
    static GCS *_singleton;

    uint32_t _statustext_sent;
};

GCS &gcs();

#define GCS_SEND_TEXT(severity, format, args...) do { \
        GCS *_gcs = GCS::get_singleton(); \
        if (_gcs != nullptr) { _gcs->send_text(severity, format, ##args); } \
    } while (0)
