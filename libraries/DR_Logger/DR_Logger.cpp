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

#include <inttypes.h>
#include <stdio.h>
#include <string.h>

#include <DR_HAL/DR_HAL.h>

#include "DR_Logger.h"

DR_Logger *DR_Logger::_singleton;

DR_Logger::DR_Logger() :
    _backend(nullptr),
    _num_formats(0),
    _internal_error_count(0),
    _last_internal_error(InternalError::flow_of_control)
{
    if (_singleton != nullptr) {
        DR_HAL::panic("DR_Logger must be singleton");
    }
    _singleton = this;
}

bool DR_Logger::init(DR_Logger_Backend *backend)
{
    _backend = backend;
    _num_formats = 0;
    if (_backend == nullptr) {
        return false;
    }
    return _backend->init();
}

bool DR_Logger::logging_started() const
{
    return _backend != nullptr && _backend->logging_started();
}

bool DR_Logger::format_written(const char *name)
{
    for (uint8_t i=0; i<_num_formats; i++) {
        if (strcmp(_formats[i], name) == 0) {
            return true;
        }
    }
    return false;
}

bool DR_Logger::write_format(const char *name, const char *labels, const char *fmt)
{
    char line[LOGGER_MAX_LINE_LENGTH];
    snprintf(line, sizeof(line), "FMT, %s, %s, %s", name, fmt, labels);
    if (!_backend->write_line(line)) {
        return false;
    }
    if (_num_formats < LOGGER_MAX_MSG_TYPES) {
        _formats[_num_formats++] = name;
    }
    return true;
}

void DR_Logger::Write(const char *name, const char *labels, const char *fmt, ...)
{
    va_list arg_list;

    va_start(arg_list, fmt);
    WriteV(name, labels, fmt, arg_list);
    va_end(arg_list);
}

void DR_Logger::WriteV(const char *name, const char *labels, const char *fmt, va_list arg_list)
{
    if (!logging_started()) {
        return;
    }
    if (!format_written(name) && !write_format(name, labels, fmt)) {
        return;
    }

    char line[LOGGER_MAX_LINE_LENGTH];
    size_t ofs = snprintf(line, sizeof(line), "%s", name);

    for (const char *p = fmt; *p != 0 && ofs < sizeof(line); p++) {
        const size_t space = sizeof(line) - ofs;
        int n = 0;
        switch (*p) {
        case 'b':
        case 'h':
        case 'i':
            n = snprintf(&line[ofs], space, ", %d", va_arg(arg_list, int));
            break;
        case 'B':
        case 'H':
        case 'I':
            n = snprintf(&line[ofs], space, ", %u", va_arg(arg_list, unsigned));
            break;
        case 'f':
        case 'd':
            n = snprintf(&line[ofs], space, ", %.6g", va_arg(arg_list, double));
            break;
        case 'q':
            n = snprintf(&line[ofs], space, ", %" PRId64, va_arg(arg_list, int64_t));
            break;
        case 'Q':
            n = snprintf(&line[ofs], space, ", %" PRIu64, va_arg(arg_list, uint64_t));
            break;
        case 'n':
            n = snprintf(&line[ofs], space, ", %.4s", va_arg(arg_list, const char *));
            break;
        case 'N':
            n = snprintf(&line[ofs], space, ", %.16s", va_arg(arg_list, const char *));
            break;
        case 'Z':
            n = snprintf(&line[ofs], space, ", %.64s", va_arg(arg_list, const char *));
            break;
        default:
            // unknown format character, the record can't be decoded
            internal_error(InternalError::flow_of_control, __LINE__);
            return;
        }
        if (n < 0) {
            return;
        }
        ofs += n;
    }

    _backend->write_line(line);
}

void DR_Logger::Write_Event(LogEvent id)
{
    Write("EV", "TimeUS,Id", "QB",
          DR_HAL::micros64(),
          (uint8_t)id);
}

void DR_Logger::Write_Error(LogErrorSubsystem sub_system, LogErrorCode error_code)
{
    Write_Error(sub_system, (uint8_t)error_code);
}

void DR_Logger::Write_Error(LogErrorSubsystem sub_system, uint8_t error_code)
{
    Write("ERR", "TimeUS,Subsys,ECode", "QBB",
          DR_HAL::micros64(),
          (uint8_t)sub_system,
          error_code);
}

void DR_Logger::Write_Message(const char *message)
{
    Write("MSG", "TimeUS,Message", "QZ",
          DR_HAL::micros64(),
          message);
}

void DR_Logger::Write_Mode(uint8_t mode, uint8_t reason)
{
    Write("MODE", "TimeUS,ModeNum,Rsn", "QBB",
          DR_HAL::micros64(),
          mode,
          reason);
}

void DR_Logger::internal_error(InternalError error, uint16_t line)
{
    _internal_error_count++;
    _last_internal_error = error;
    Write("IERR", "TimeUS,Err,Line", "QBH",
          DR_HAL::micros64(),
          (uint8_t)error,
          line);
}

void DR_Logger::flush()
{
    if (_backend != nullptr) {
        _backend->flush();
    }
}

namespace DR {

DR_Logger &logger()
{
    return *DR_Logger::get_singleton();
}

};
