/**
 * @file DR_Failsafe_config.h
 * @brief Compile time constants of the dead reckoning failsafe
 *
 * @details Timings that are fixed by the failsafe behaviour rather than
 *          tuned per vehicle. Each may be overridden by the board build.
 */

#pragma once

// inputs must stay good this long before the vehicle counts as recovered
#ifndef DR_FAILSAFE_RECOVERY_DELAY_MS
#define DR_FAILSAFE_RECOVERY_DELAY_MS 3000
#endif

// time spent holding the vehicle level before flying home
#ifndef DR_FAILSAFE_LEVEL_TIME_MS
#define DR_FAILSAFE_LEVEL_TIME_MS 5000
#endif

// minimum time between repeated status messages
#ifndef DR_FAILSAFE_USER_UPDATE_MS
#define DR_FAILSAFE_USER_UPDATE_MS 5000
#endif

// tick interval while DR_ENABLE is zero
#ifndef DR_FAILSAFE_DISABLED_INTERVAL_MS
#define DR_FAILSAFE_DISABLED_INTERVAL_MS 1000
#endif

#ifndef DR_FAILSAFE_INTERVAL_MIN_MS
#define DR_FAILSAFE_INTERVAL_MIN_MS 10
#endif

#ifndef DR_FAILSAFE_INTERVAL_MAX_MS
#define DR_FAILSAFE_INTERVAL_MAX_MS 1000
#endif
