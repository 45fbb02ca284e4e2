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

#include <stdio.h>

#include <DR_HAL/DR_HAL.h>
#include <DR_Logger/DR_Logger.h>

#include "GCS.h"

GCS *GCS::_singleton;

GCS::GCS() :
    _statustext_sent(0)
{
    if (_singleton != nullptr) {
        DR_HAL::panic("GCS must be singleton");
    }
    _singleton = this;
}

GCS::~GCS()
{
    if (_singleton == this) {
        _singleton = nullptr;
    }
}

void GCS::send_text(DR_Severity severity, const char *fmt, ...)
{
    va_list arg_list;
    va_start(arg_list, fmt);
    send_textv(severity, fmt, arg_list);
    va_end(arg_list);
}

void GCS::send_textv(DR_Severity severity, const char *fmt, va_list arg_list)
{
    char text[GCS_STATUSTEXT_LEN+1];
    vsnprintf(text, sizeof(text), fmt, arg_list);

    DR_Logger *logger = DR_Logger::get_singleton();
    if (logger != nullptr) {
        logger->Write_Message(text);
    }

    _statustext_sent++;
    send_statustext(severity, text);
}

GCS &gcs()
{
    return *GCS::get_singleton();
}
