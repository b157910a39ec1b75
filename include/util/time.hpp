// Copyright (c) 2024 Chaincraft
// Distributed under the MIT software license

#ifndef CHAINCRAFT_UTIL_TIME_HPP
#define CHAINCRAFT_UTIL_TIME_HPP

#include <chrono>
#include <cstdint>

namespace chaincraft {
namespace util {

/**
 * Mockable time system for testing
 *
 * Production code calls GetTime() or GetSteadyTime() instead of direct clock
 * calls. Tests call SetMockTime() to control the current time. When mock time
 * is 0 (default), time functions return real time.
 */

/**
 * Get current time as Unix timestamp (seconds since epoch)
 * Returns mock time if set, otherwise returns real system time
 */
int64_t GetTime();

/**
 * Get current time as steady clock time point
 *
 * While mock time is active the steady clock is anchored at the first mocked
 * value and advances by exactly the mocked delta, so TTLs and timeouts that
 * are measured on the steady clock follow SetMockTime().
 */
std::chrono::steady_clock::time_point GetSteadyTime();

/**
 * Set mock time for testing
 *
 * @param time Unix timestamp in seconds (0 to disable mocking)
 *
 * Time does not advance automatically while mocked. Setting 0 returns to real
 * time and drops the steady clock anchor.
 */
void SetMockTime(int64_t time);

/**
 * Get current mock time setting
 * Returns 0 if mock time is disabled (using real time)
 */
int64_t GetMockTime();

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

private:
  int64_t previous_time_;
};

} // namespace util
} // namespace chaincraft

#endif // CHAINCRAFT_UTIL_TIME_HPP
