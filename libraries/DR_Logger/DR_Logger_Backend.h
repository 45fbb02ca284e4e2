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

/**
 * @class DR_Logger_Backend
 * @brief Destination of formatted log records
 *
 * @details The frontend turns each record into one text line of the form
 *          "NAME, v1, v2, ..." and announces each message type once with a
 *          "FMT, NAME, Fmt, Labels" line before its first record.
 */
class DR_Logger_Backend
{
public:
    virtual ~DR_Logger_Backend() {}

    virtual bool init() = 0;

    // write one complete record line without the line terminator
    virtual bool write_line(const char *line) = 0;

    virtual void flush() {}

    virtual bool logging_started() const = 0;
};
