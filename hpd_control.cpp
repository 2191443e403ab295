#include "hpd_control.h"

#include <unistd.h>

static const uint32_t HPD_BASE = 0xff21a000;
static const uint32_t BIT_UNPLUG = 0;
static const uint32_t BIT_PLUG = 1;

static uint32_t hpd_offset(connector_id id) {
  switch (id) {
    case CONN_DP1: return 0x4;
    case CONN_DP2: return 0x8;
    case CONN_HDMI: return 0xc;
    default: return 0;
  }
}

bool hpd_control::is_plugged(connector_id id) {
  if (!has_hpd(id)) return false;
  return mem_->read(HPD_BASE + hpd_offset(id)) == BIT_PLUG;
}

void hpd_control::plug(connector_id id) {
  if (!has_hpd(id)) return;
  mem_->write(HPD_BASE + hpd_offset(id), BIT_PLUG);
}

void hpd_control::unplug(connector_id id) {
  if (!has_hpd(id)) return;
  mem_->write(HPD_BASE + hpd_offset(id), BIT_UNPLUG);
}

bool hpd_control::fire_pulse(connector_id id, uint32_t deassert_us, uint32_t assert_us,
                             int repeat_count, int end_level, cap_error *err) {
  if (!has_hpd(id))
    return cap_fail(err, cap_err_kind::UNSUPPORTED, "%s has no HPD line", connector_name(id));
  if (repeat_count < 1 || deassert_us == 0)
    return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "bad HPD pulse (repeat=%d width=%u)",
                    repeat_count, deassert_us);
  if (assert_us == 0) assert_us = deassert_us;
  for (int i = 0; i < repeat_count; i++) {
    unplug(id);
    usleep(deassert_us);
    plug(id);
    if (i + 1 < repeat_count) usleep(assert_us);
  }
  if (end_level == 0) {
    usleep(assert_us);
    unplug(id);
  }
  return true;
}

bool hpd_control::fire_mixed_pulses(connector_id id, const uint32_t *widths_us, size_t count,
                                    cap_error *err) {
  if (!has_hpd(id))
    return cap_fail(err, cap_err_kind::UNSUPPORTED, "%s has no HPD line", connector_name(id));
  if (count == 0)
    return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "no HPD segment widths");
  for (size_t i = 0; i < count; i++) {
    if ((i % 2) == 0) unplug(id);
    else plug(id);
    usleep(widths_us[i]);
  }
  // An odd number of segments ends high, an even number low.
  if (count % 2) plug(id);
  else unplug(id);
  return true;
}
