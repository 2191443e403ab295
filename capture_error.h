#pragma once
#include <stdint.h>
#include <string>
#include <vector>

// Error kinds reported by the capture engine. Only BUS is retried internally;
// everything else is returned to the caller as-is.
enum class cap_err_kind {
  NONE = 0,
  BUS = 1,                  // I2C transfer failed after retries
  TIMEOUT = 2,              // wait exceeded; reg_dump holds the last register state
  CABLE_DISCONNECTED = 3,   // link error: no cable power detected
  PORT_NOT_PLUGGED = 4,     // link error: HPD not asserted
  FSM_FAILURE = 5,          // link error: anything else
  ALIGNMENT = 6,            // crop window rejected before touching hardware
  OVERFLOW = 7,             // ring buffer would be overwritten
  INVALID_ARGUMENT = 8,
  INVALID_STATE = 9,
  UNSUPPORTED = 10,
  TOOL_FAILURE = 11,        // external pixeldump/histogram tool failed
};

struct cap_error {
  cap_err_kind kind = cap_err_kind::NONE;
  std::string msg;
  std::vector<uint8_t> reg_dump;
};

const char *cap_err_kind_name(cap_err_kind k);
bool cap_err_is_link_error(cap_err_kind k);

// Fills *err (if non-null), logs it and returns false.
bool cap_fail(cap_error *err, cap_err_kind kind, const char *fmt, ...)
    __attribute__((format(printf, 3, 4)));

// Appends 32-bit words to a register dump, little endian.
void cap_dump_append_u32(std::vector<uint8_t> &dump, uint32_t v);

// "00: 12 34 ..." lines, 16 bytes per line.
std::string cap_dump_to_hex(const std::vector<uint8_t> &dump);
