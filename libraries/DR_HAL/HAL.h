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

#include "DR_HAL_Namespace.h"
#include "RCInput.h"
#include "Scheduler.h"
#include "system.h"

/**
 * @class DR_HAL::HAL
 * @brief Aggregate of the board drivers used by the vehicle
 *
 * @details A board backend constructs one HAL instance with its drivers and
 *          returns it from DR_HAL::get_HAL(). Vehicle and library code
 *          reach the drivers through the global reference
 *          @code extern const DR_HAL::HAL& hal; @endcode
 */
class DR_HAL::HAL {
public:
    HAL(DR_HAL::RCInput*    _rcin,
        DR_HAL::Scheduler*  _scheduler)
        :
        rcin(_rcin),
        scheduler(_scheduler)
    {
        DR_HAL::init();
    }

    struct Callbacks {
        virtual void setup() = 0;
        virtual void loop() = 0;
    };

    struct FunCallbacks : public Callbacks {
        FunCallbacks(void (*setup_fun)(void), void (*loop_fun)(void));

        void setup() override { _setup(); }
        void loop() override { _loop(); }

    private:
        void (*_setup)(void);
        void (*_loop)(void);
    };

    /// run the vehicle until the board decides to stop, returns the exit code
    virtual int run(int argc, char * const argv[], Callbacks* callbacks) const = 0;

    DR_HAL::RCInput*    rcin;
    DR_HAL::Scheduler*  scheduler;
};

// used by vehicles to define main()
#define DR_HAL_MAIN_CALLBACKS(CALLBACKS) extern "C" { \
    int main(int argc, char* const argv[]); \
    int main(int argc, char* const argv[]) { \
        return hal.run(argc, argv, CALLBACKS); \
    } \
    }
