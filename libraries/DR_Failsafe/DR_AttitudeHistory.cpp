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

#include "DR_AttitudeHistory.h"

#include <new>
#include <string.h>

DR_AttitudeHistory::DR_AttitudeHistory() :
    _samples(nullptr),
    _count(0),
    _capacity(0)
{
}

DR_AttitudeHistory::~DR_AttitudeHistory()
{
    delete[] _samples;
}

/*
  double the storage, copying the existing samples. The old storage is
  kept if the allocation fails.
 */
bool DR_AttitudeHistory::expand()
{
    uint32_t new_capacity = _capacity * 2;
    if (new_capacity < DR_HISTORY_INITIAL_SAMPLES) {
        new_capacity = DR_HISTORY_INITIAL_SAMPLES;
    }
    if (new_capacity <= _capacity) {
        // counter overflow
        return false;
    }
    DR_AttitudeSample *new_samples = NEW_NOTHROW DR_AttitudeSample[new_capacity];
    if (new_samples == nullptr) {
        return false;
    }
    if (_count > 0) {
        memcpy(new_samples, _samples, _count * sizeof(DR_AttitudeSample));
    }
    delete[] _samples;
    _samples = new_samples;
    _capacity = new_capacity;
    return true;
}

bool DR_AttitudeHistory::push(const DR_AttitudeSample &sample)
{
    if (_count >= _capacity && !expand()) {
        return false;
    }
    _samples[_count++] = sample;
    return true;
}

bool DR_AttitudeHistory::pop(DR_AttitudeSample &sample)
{
    if (_count <= 1) {
        return false;
    }
    sample = _samples[--_count];
    return true;
}

bool DR_AttitudeHistory::latest(DR_AttitudeSample &sample) const
{
    if (_count == 0) {
        return false;
    }
    sample = _samples[_count-1];
    return true;
}

bool DR_AttitudeHistory::get(uint32_t index, DR_AttitudeSample &sample) const
{
    if (index >= _count) {
        return false;
    }
    sample = _samples[index];
    return true;
}

void DR_AttitudeHistory::clear()
{
    delete[] _samples;
    _samples = nullptr;
    _count = 0;
    _capacity = 0;
}
