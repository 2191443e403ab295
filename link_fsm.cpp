#include "link_fsm.h"

#include <strings.h>
#include <cstdio>

#include "wait_util.h"

bool hysteresis_update(const pixel_mode_hysteresis &h, double pclk_mhz, bool *dual) {
  if (pclk_mhz >= h.low_mhz && pclk_mhz <= h.high_mhz) return false;
  bool want = pclk_mhz > h.high_mhz;
  if (want == *dual) return false;
  *dual = want;
  return true;
}

const char *link_fsm_state_name(link_fsm_state s) {
  switch (s) {
    case link_fsm_state::NEEDS_RESET: return "needs_reset";
    case link_fsm_state::STABILIZING_INPUT: return "stabilizing_input";
    case link_fsm_state::SELECTING_PIXEL_MODE: return "selecting_pixel_mode";
    case link_fsm_state::SELECTING_PATH: return "selecting_path";
    case link_fsm_state::VERIFYING_LOCK: return "verifying_lock";
    case link_fsm_state::LOCKED: return "locked";
    case link_fsm_state::FAILED: return "failed";
  }
  return "?";
}

link_fsm::link_fsm(const char *name, rx_chip *rx, link_port *port, bool initial_dual,
                   const pixel_mode_hysteresis &hyst, const link_fsm_timing &timing)
    : name_(name), rx_(rx), port_(port), hyst_(hyst), timing_(timing) {
  state_.dual = initial_dual;
}

void link_fsm::enter(link_fsm_state s) {
  if (s != current_)
    fprintf(stderr, "[fsm] %s: %s -> %s\n", name_, link_fsm_state_name(current_), link_fsm_state_name(s));
  current_ = s;
  state_.locked = (s == link_fsm_state::LOCKED);
}

bool link_fsm::run(cap_error *err) {
  current_ = link_fsm_state::NEEDS_RESET;
  state_.locked = false;
  cap_error local;
  if (!err) err = &local;
  if (do_run(err)) {
    enter(link_fsm_state::LOCKED);
    return true;
  }
  enter(link_fsm_state::FAILED);
  return false;
}

bool link_fsm::wait_input_stable(bool *stable, cap_error *err) {
  uint32_t t = timing_.stable_timeout_ms ? timing_.stable_timeout_ms : rx_->stable_timeout_ms();
  return rx_->wait_video_input_stable(t, stable, err);
}

bool link_fsm::is_frame_locked(bool *locked, cap_error *err) {
  uint32_t fw = 0, fh = 0, rw = 0, rh = 0;
  if (!port_->fpga_resolution(&fw, &fh, err)) return false;
  if (!rx_->frame_resolution(&rw, &rh, err)) return false;
  *locked = (fw == rw && fh == rh);
  if (*locked)
    fprintf(stderr, "[fsm] %s: same resolution: %ux%u\n", name_, fw, fh);
  else
    fprintf(stderr, "[fsm] %s: diff resolution: fpga:%ux%u != rx:%ux%u\n", name_, fw, fh, rw, rh);
  return true;
}

bool link_fsm::wait_lock(uint32_t timeout_ms, bool *locked, cap_error *err) {
  cap_error werr;
  bool ok = wait_for_condition([this](bool *met, cap_error *e) {
    return is_frame_locked(met, e);
  }, timing_.lock_probe_ms, timeout_ms, "frame lock", &werr);
  if (ok) {
    *locked = true;
    return true;
  }
  if (werr.kind == cap_err_kind::TIMEOUT) {
    *locked = false;
    return true;
  }
  if (err) *err = werr;
  return false;
}

bool link_fsm::select_pixel_mode(bool *changed, cap_error *err) {
  double pclk = 0.0;
  if (!rx_->pixel_clock_mhz(&pclk, err)) return false;
  state_.last_pclk_mhz = pclk;
  fprintf(stderr, "[fsm] %s: PCLK = %.2f MHz\n", name_, pclk);
  *changed = hysteresis_update(hyst_, pclk, &state_.dual);
  if (!*changed) return true;
  fprintf(stderr, "[fsm] %s: changed to %s pixel mode\n", name_, state_.dual ? "dual" : "single");
  return rx_->set_pixel_mode(state_.dual, err);
}

bool link_fsm::fail_link(cap_error *err) {
  bool powered = true, plugged = true;
  if (!rx_->is_cable_powered(&powered, err)) return false;
  if (!powered)
    return cap_fail(err, cap_err_kind::CABLE_DISCONNECTED, "%s cable disconnected; probably a dongle issue", name_);
  if (!port_->is_hpd_plugged(&plugged, err)) return false;
  if (!plugged)
    return cap_fail(err, cap_err_kind::PORT_NOT_PLUGGED, "%s port not plugged; probably a programming issue", name_);
  return cap_fail(err, cap_err_kind::FSM_FAILURE, "%s FSM failed", name_);
}

bool link_fsm::fail_timeout(const char *what, cap_error *err) {
  std::vector<uint8_t> dump;
  cap_error derr;
  if (!rx_->dump_registers(&dump, &derr))
    fprintf(stderr, "[fsm] %s: register dump failed: %s\n", name_, derr.msg.c_str());
  cap_fail(err, cap_err_kind::TIMEOUT, "Timeout waiting %s", what);
  if (err) err->reg_dump = dump;
  if (!dump.empty())
    fprintf(stderr, "[fsm] %s: RX dump:\n%s", name_, cap_dump_to_hex(dump).c_str());
  return false;
}

bool dp_link_fsm::do_run(cap_error *err) {
  enter(link_fsm_state::NEEDS_RESET);
  bool stable = false, locked = false, changed = false;
  if (!rx_->is_video_input_stable(&stable, err)) return false;
  if (stable && !is_frame_locked(&locked, err)) return false;

  if (stable && locked) {
    enter(link_fsm_state::SELECTING_PIXEL_MODE);
    if (!select_pixel_mode(&changed, err)) return false;
    if (!changed) {
      fprintf(stderr, "[fsm] DP: skip resetting rx\n");
      return true;
    }
    enter(link_fsm_state::SELECTING_PATH);
    if (!port_->select_path(state_.dual, err)) return false;
    enter(link_fsm_state::VERIFYING_LOCK);
    if (!wait_lock(timing_.lock_timeout_ms, &locked, err)) return false;
    return locked ? true : fail_link(err);
  }

  if (!port_->reinit_receiver(state_.dual, err)) return false;
  enter(link_fsm_state::STABILIZING_INPUT);
  if (!wait_input_stable(&stable, err)) return false;
  if (!stable) {
    fprintf(stderr, "[fsm] DP: send HPD pulse to reset source\n");
    if (!port_->set_hpd(false, err)) return false;
    sleep_ms(timing_.hpd_pulse_ms);
    if (!port_->set_hpd(true, err)) return false;
    if (!wait_input_stable(&stable, err)) return false;
  }
  if (stable) {
    enter(link_fsm_state::SELECTING_PIXEL_MODE);
    if (!select_pixel_mode(&changed, err)) return false;
    enter(link_fsm_state::SELECTING_PATH);
    if (!port_->select_path(state_.dual, err)) return false;
    enter(link_fsm_state::VERIFYING_LOCK);
    if (!wait_lock(timing_.lock_timeout_ms, &locked, err)) return false;
    if (locked) {
      fprintf(stderr, "[fsm] DP FSM done\n");
      return true;
    }
  }
  return fail_link(err);
}

bool hdmi_link_fsm::do_run(cap_error *err) {
  enter(link_fsm_state::NEEDS_RESET);
  bool reset_needed = false, stable = false, changed = false, locked = false;
  if (!rx_->is_reset_needed(&reset_needed, err)) return false;
  if (reset_needed && !rx_->reset(err)) return false;

  enter(link_fsm_state::STABILIZING_INPUT);
  if (!wait_input_stable(&stable, err)) return false;
  if (!stable) {
    fprintf(stderr, "[fsm] HDMI: video input not stable\n");
    return fail_link(err);
  }

  enter(link_fsm_state::SELECTING_PIXEL_MODE);
  if (!select_pixel_mode(&changed, err)) return false;
  if (changed) {
    enter(link_fsm_state::SELECTING_PATH);
    if (!port_->select_path(state_.dual, err)) return false;
  }
  if (!reset_needed && !changed) return true;

  enter(link_fsm_state::VERIFYING_LOCK);
  // Some sources send bad pixels for a while after the receiver locks.
  sleep_ms(timing_.settle_ms);
  if (!wait_lock(timing_.lock_timeout_ms, &locked, err)) return false;
  if (!locked) return fail_timeout("video output stable", err);
  return true;
}

bool vga_link_fsm::set_mode(const std::string &mode, cap_error *err) {
  if (strcasecmp(mode.c_str(), "auto") == 0) {
    auto_mode_ = true;
    return true;
  }
  if (!vga_rx::mode_known(mode))
    return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "unsupported VGA mode: %s", mode.c_str());
  if (!vga_->set_mode(mode, err)) return false;
  auto_mode_ = false;
  fprintf(stderr, "[fsm] VGA: mode pinned to %s\n", mode.c_str());
  return true;
}

bool vga_link_fsm::is_physical_plugged(bool *plugged, cap_error *err) {
  bool before = false, stable = false;
  if (!port_->is_hpd_plugged(&before, err)) return false;
  if (!before && !port_->set_hpd(true, err)) return false;
  bool ok = wait_input_stable(&stable, err);
  if (!before) {
    cap_error rerr;
    if (!port_->set_hpd(false, ok ? err : &rerr)) return false;
  }
  if (!ok) return false;
  *plugged = stable;
  return true;
}

bool vga_link_fsm::is_resolution_valid(bool *valid, cap_error *err) {
  uint32_t w1 = 0, h1 = 0, w2 = 0, h2 = 0;
  if (!port_->fpga_resolution(&w1, &h1, err)) return false;
  sleep_ms(timing_.resolution_probe_ms);
  if (!port_->fpga_resolution(&w2, &h2, err)) return false;
  *valid = (w1 == w2 && h1 == h2 && w1 != 0 && h1 != 0);
  return true;
}

bool vga_link_fsm::wait_lock(uint32_t timeout_ms, bool *locked, cap_error *err) {
  cap_error werr;
  bool ok = wait_for_condition([this](bool *met, cap_error *e) {
    return is_resolution_valid(met, e);
  }, timing_.lock_probe_ms, timeout_ms, "VGA resolution", &werr);
  if (ok) {
    *locked = true;
    return true;
  }
  if (werr.kind == cap_err_kind::TIMEOUT) {
    *locked = false;
    return true;
  }
  if (err) *err = werr;
  return false;
}

bool vga_link_fsm::do_run(cap_error *err) {
  enter(link_fsm_state::NEEDS_RESET);
  bool stable = false, locked = false;
  if (auto_mode_) {
    enter(link_fsm_state::STABILIZING_INPUT);
    if (!wait_input_stable(&stable, err)) return false;
    if (!stable) {
      bool physical = false;
      if (!is_physical_plugged(&physical, err)) return false;
      if (!physical)
        return cap_fail(err, cap_err_kind::CABLE_DISCONNECTED, "VGA source not detected");
      return cap_fail(err, cap_err_kind::FSM_FAILURE, "VGA input not stable");
    }
    enter(link_fsm_state::SELECTING_PIXEL_MODE);
    std::string mode;
    if (!vga_->detect_mode(&mode, err)) return false;
    if (!vga_->set_mode(mode, err)) return false;
  }
  enter(link_fsm_state::VERIFYING_LOCK);
  if (!wait_lock(timing_.lock_timeout_ms, &locked, err)) return false;
  if (!locked) return fail_timeout("VGA resolution stable", err);
  return true;
}

std::unique_ptr<link_fsm> make_link_fsm(connector_id id, rx_chip *rx, link_port *port,
                                        const pixel_mode_hysteresis &hyst) {
  switch (connector_type_of(id)) {
    case CONNECTOR_DP:
      return std::unique_ptr<link_fsm>(new dp_link_fsm(rx, port, hyst));
    case CONNECTOR_HDMI:
      return std::unique_ptr<link_fsm>(new hdmi_link_fsm(rx, port, hyst));
    case CONNECTOR_VGA: {
      vga_rx *vga = dynamic_cast<vga_rx*>(rx);
      if (!vga) return nullptr;
      return std::unique_ptr<link_fsm>(new vga_link_fsm(vga, port));
    }
  }
  return nullptr;
}
