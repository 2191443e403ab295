#pragma once
#include <stdint.h>

#include "capture_error.h"
#include "connector_ids.h"
#include "fpga_mem.h"

// HPD lines driven by the FPGA. VGA has none.
class hpd_control {
public:
  explicit hpd_control(fpga_mem *mem) : mem_(mem) {}

  static bool has_hpd(connector_id id) { return id != CONN_VGA; }

  bool is_plugged(connector_id id);
  void plug(connector_id id);
  void unplug(connector_id id);

  // repeat_count low->high pulses; the line finishes at end_level.
  // assert_us == 0 means same as deassert_us.
  bool fire_pulse(connector_id id, uint32_t deassert_us, uint32_t assert_us,
                  int repeat_count, int end_level, cap_error *err);

  // Alternating low/high segments starting low, widths in microseconds.
  bool fire_mixed_pulses(connector_id id, const uint32_t *widths_us, size_t count, cap_error *err);

private:
  fpga_mem *mem_;
};
