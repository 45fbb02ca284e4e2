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
 * @file DR_HAL_Macros.h
 * @brief Compiler attribute helpers shared by every DeadReckon library
 */

#include <stddef.h>
#include <new>

#define FMT_PRINTF(a,b) __attribute__((format(printf, a, b)))
#define NORETURN __attribute__ ((noreturn))
#define WARN_IF_UNUSED __attribute__ ((warn_unused_result))
#define FALLTHROUGH __attribute__ ((fallthrough))

// used to forbid copy of objects
#define CLASS_NO_COPY(c) c(const c &other) = delete; c &operator=(const c&) = delete

#ifndef ARRAY_SIZE
#define ARRAY_SIZE(_arr) (sizeof(_arr) / sizeof(_arr[0]))
#endif

// allocations on the flight path must never throw
#define NEW_NOTHROW new(std::nothrow)
