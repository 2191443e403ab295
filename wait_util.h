#pragma once
#include <stdint.h>
#include <functional>

#include "capture_error.h"

uint64_t monotonic_ms();
void sleep_ms(uint32_t ms);

// Probe for wait_for_condition(). Sets *met when the condition holds; returns
// false (with err filled) to abort the wait with that error.
typedef std::function<bool(bool *met, cap_error *err)> wait_probe;

// Polls probe every delay_ms until it reports met or timeout_ms elapses.
// On timeout fills err with TIMEOUT and "Timeout waiting for <what>".
bool wait_for_condition(const wait_probe &probe, uint32_t delay_ms,
                        uint32_t timeout_ms, const char *what, cap_error *err);
