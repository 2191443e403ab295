#include "wait_util.h"

#include <time.h>
#include <unistd.h>

uint64_t monotonic_ms() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return (uint64_t)ts.tv_sec * 1000ull + (uint64_t)ts.tv_nsec / 1000000ull;
}

void sleep_ms(uint32_t ms) {
  if (ms == 0) return;
  usleep((useconds_t)ms * 1000);
}

bool wait_for_condition(const wait_probe &probe, uint32_t delay_ms,
                        uint32_t timeout_ms, const char *what, cap_error *err) {
  uint64_t deadline = monotonic_ms() + timeout_ms;
  for (;;) {
    bool met = false;
    if (!probe(&met, err)) return false;
    if (met) return true;
    if (monotonic_ms() >= deadline) break;
    sleep_ms(delay_ms);
  }
  return cap_fail(err, cap_err_kind::TIMEOUT, "Timeout waiting for %s (%u ms)",
                  what, timeout_ms);
}
