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

#include <stdio.h>

#include "DR_Logger_Backend.h"

/*
  log backend writing text records to a file on the host filesystem
 */
class DR_Logger_File : public DR_Logger_Backend
{
public:
    explicit DR_Logger_File(const char *path);
    ~DR_Logger_File() override;

    bool init() override;
    bool write_line(const char *line) override;
    void flush() override;
    bool logging_started() const override { return _fd != nullptr; }

    uint32_t lines_written() const { return _lines_written; }

private:
    const char *_path;
    FILE *_fd;
    uint32_t _lines_written;
    bool _open_error;
};
