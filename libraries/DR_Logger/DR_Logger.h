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
 * @file DR_Logger.h
 * @brief Flight log frontend
 *
 * @details Records are described by a name of at most four characters, a
 *          comma separated list of labels and a format string with one
 *          character per field:
 *
 *          | char | type             |
 *          |------|------------------|
 *          | b    | int8_t           |
 *          | B    | uint8_t          |
 *          | h    | int16_t          |
 *          | H    | uint16_t         |
 *          | i    | int32_t          |
 *          | I    | uint32_t         |
 *          | f    | float            |
 *          | d    | double           |
 *          | q    | int64_t          |
 *          | Q    | uint64_t         |
 *          | n    | char[4] string   |
 *          | N    | char[16] string  |
 *          | Z    | char[64] string  |
 *
 *          Usage:
 *          @code
 *          LOGGER_WRITE_EVENT(LogEvent::DR_LEVEL_START);
 *          DR::logger().Write("DRFH", "TimeUS,Roll,Pitch", "Qff",
 *                             DR_HAL::micros64(), roll, pitch);
 *          @endcode
 */

#include <stdarg.h>
#include <stdint.h>

#include <DR_HAL/DR_HAL_Macros.h>

#include "DR_Logger_Backend.h"

#define LOGGER_MAX_MSG_TYPES    32
#define LOGGER_MAX_LINE_LENGTH  256

enum class LogEvent : uint8_t {
    ARMED = 10,
    DISARMED = 11,

    DR_ENABLED = 80,
    DR_LEVEL_START = 81,
    DR_FLY_HOME_START = 82,
    DR_PILOT_OVERRIDE = 83,
    DR_RECOVERED = 84,
    DR_TIMEOUT = 85,
    DR_STAGE_RESET = 86,
};

enum class LogErrorSubsystem : uint8_t {
    MAIN = 1,
    RADIO = 2,
    FAILSAFE_RADIO = 5,
    FLIGHT_MODE = 10,
    FAILSAFE_DEADRECKON = 30,
    DEADRECKON_MEMORY = 31,
    INTERNAL_ERROR = 32,
};

enum class LogErrorCode : uint8_t {
    ERROR_RESOLVED = 0,
    FAILED_TO_INITIALISE = 1,
    UNHEALTHY = 4,

    // subsystem specific error codes -- failsafes
    FAILSAFE_RESOLVED = 0,
    FAILSAFE_OCCURRED = 1,

    // flight mode
    // 0 is not used, non-zero is the mode that could not be entered
};

/*
  errors that should never happen. They are logged and counted and
  flight continues.
 */
enum class InternalError : uint8_t {
    flow_of_control = 1,
    bad_stage = 2,
};

class DR_Logger
{
public:
    DR_Logger();

    CLASS_NO_COPY(DR_Logger);

    static DR_Logger *get_singleton(void) {
        return _singleton;
    }

    // attach a backend, nullptr disables logging
    bool init(DR_Logger_Backend *backend);

    bool logging_started() const;

    void Write_Event(LogEvent id);
    void Write_Error(LogErrorSubsystem sub_system, LogErrorCode error_code);
    void Write_Error(LogErrorSubsystem sub_system, uint8_t error_code);
    void Write_Message(const char *message);
    void Write_Mode(uint8_t mode, uint8_t reason);

    void Write(const char *name, const char *labels, const char *fmt, ...);
    void WriteV(const char *name, const char *labels, const char *fmt, va_list arg_list);

    // record an error that should never happen
    void internal_error(InternalError error, uint16_t line);
    uint32_t internal_error_count() const { return _internal_error_count; }
    InternalError last_internal_error() const { return _last_internal_error; }

    void flush();

private:
    bool format_written(const char *name);
    bool write_format(const char *name, const char *labels, const char *fmt);

    static DR_Logger *_singleton;

    DR_Logger_Backend *_backend;

    // names of the message types whose FMT line has been written
    const char *_formats[LOGGER_MAX_MSG_TYPES];
    uint8_t _num_formats;

    uint32_t _internal_error_count;
    InternalError _last_internal_error;
};

namespace DR {
    DR_Logger &logger();
};

#define LOGGER_WRITE_EVENT(evt) do { \
        DR_Logger *_logger = DR_Logger::get_singleton(); \
        if (_logger != nullptr) { _logger->Write_Event(evt); } \
    } while (0)

#define LOGGER_WRITE_ERROR(subsys, err) do { \
        DR_Logger *_logger = DR_Logger::get_singleton(); \
        if (_logger != nullptr) { _logger->Write_Error(subsys, err); } \
    } while (0)

#define INTERNAL_ERROR(error_type) do { \
        DR_Logger *_logger = DR_Logger::get_singleton(); \
        if (_logger != nullptr) { _logger->internal_error(error_type, __LINE__); } \
    } while (0)
