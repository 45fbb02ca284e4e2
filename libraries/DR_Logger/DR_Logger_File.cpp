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

#include <errno.h>
#include <errno.h>
#include <string.h>

#include <GCS/GCS.h>

#include "DR_Logger_File.h"

DR_Logger_File::DR_Logger_File(const char *path) :
    _path(path),
    _fd(nullptr),
    _lines_written(0),
    _open_error(false)
{
}

DR_Logger_File::~DR_Logger_File()
{
    if (_fd != nullptr) {
        fclose(_fd);
        _fd = nullptr;
    }
}

bool DR_Logger_File::init()
{
    if (_fd != nullptr) {
        return true;
    }
    if (_path == nullptr) {
        return false;
    }
    _fd = fopen(_path, "w");
    if (_fd == nullptr) {
        if (!_open_error) {
            // only complain once
            _open_error = true;
            GCS_SEND_TEXT(DR_SEVERITY_WARNING, "Log open fail for %s - %s", _path, strerror(errno));
        }
        return false;
    }
    _open_error = false;
    return true;
}

bool DR_Logger_File::write_line(const char *line)
{
    if (_fd == nullptr) {
        return false;
    }
    if (fputs(line, _fd) < 0 || fputc('\n', _fd) == EOF) {
        return false;
    }
    _lines_written++;
    return true;
}

void DR_Logger_File::flush()
{
    if (_fd != nullptr) {
        fflush(_fd);
    }
}
