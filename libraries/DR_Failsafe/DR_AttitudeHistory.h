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

/*
  attitude samples recorded while the flight is healthy, replayed
  newest first to fly the vehicle back the way it came.
 */

#include <stdint.h>

#include <DR_HAL/DR_HAL_Macros.h>

#ifndef DR_HISTORY_INITIAL_SAMPLES
#define DR_HISTORY_INITIAL_SAMPLES 600
#endif

// attitude in degrees
struct DR_AttitudeSample {
    float roll;
    float pitch;
    float yaw;
};

class DR_AttitudeHistory
{
public:
    DR_AttitudeHistory();
    ~DR_AttitudeHistory();

    CLASS_NO_COPY(DR_AttitudeHistory);

    // append a sample, false if memory for it could not be allocated
    bool push(const DR_AttitudeSample &sample) WARN_IF_UNUSED;

    /*
      remove the newest sample into sample. The oldest sample is never
      removed, false is returned once it is the only one left.
     */
    bool pop(DR_AttitudeSample &sample);

    // newest sample, false if empty
    bool latest(DR_AttitudeSample &sample) const;

    // sample at index, 0 is the oldest
    bool get(uint32_t index, DR_AttitudeSample &sample) const;

    uint32_t size() const { return _count; }
    bool empty() const { return _count == 0; }
    uint32_t capacity() const { return _capacity; }

    // remove all samples and release memory
    void clear();

private:
    bool expand();

    DR_AttitudeSample *_samples;
    uint32_t _count;
    uint32_t _capacity;
};
