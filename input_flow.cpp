#include "input_flow.h"

#include <cstdio>

input_flow::input_flow(connector_id id, std::unique_ptr<rx_chip> rx, hpd_control *hpd, power_io *power,
                       mux_io *mux, video_dumper *dumper_a, video_dumper *dumper_b,
                       pixel_dump_tool *pixdump, histogram_tool *hist, const input_flow_options &opt)
  : id_(id), rx_(std::move(rx)), hpd_(hpd), power_(power), mux_(mux),
    fields_(id, dumper_a, dumper_b, pixdump, hist, opt.fields),
    frames_(&fields_, [this](bool *interlaced, cap_error *err) { return rx_->is_interlaced(interlaced, err); }) {
  fsm_ = make_link_fsm(id_, rx_.get(), this, opt.hysteresis);
}

const char *input_flow::connector_type() const {
  switch (connector_type_of(id_)) {
    case CONNECTOR_DP: return "DP";
    case CONNECTOR_HDMI: return "HDMI";
    case CONNECTOR_VGA: return "VGA";
  }
  return "?";
}

bool input_flow::initialize(cap_error *err) {
  if (!fsm_)
    return cap_fail(err, cap_err_kind::INVALID_STATE, "%s: receiver does not match the connector",
                    connector_name(id_));
  fprintf(stderr, "[flow] initialize input #%d (%s)\n", (int)id_, connector_name(id_));
  return reinit_receiver(is_dual(), err);
}

bool input_flow::reinit_receiver(bool dual, cap_error *err) {
  if (power_ && !power_->reset_receiver(id_, err)) return false;
  return rx_->initialize(dual, err);
}

bool input_flow::select(cap_error *err) {
  fprintf(stderr, "[flow] select input #%d (%s)\n", (int)id_, connector_name(id_));
  return select_path(is_dual(), err);
}

bool input_flow::select_path(bool dual, cap_error *err) {
  if (mux_ && !mux_->set_config_for(id_, err)) return false;
  fields_.select_path(dual);
  return true;
}

bool input_flow::do_fsm(cap_error *err) {
  if (!fsm_)
    return cap_fail(err, cap_err_kind::INVALID_STATE, "%s: no link FSM", connector_name(id_));
  return fsm_->run(err);
}

bool input_flow::fpga_resolution(uint32_t *w, uint32_t *h, cap_error *err) {
  return frames_.compute_resolution(w, h, err);
}

bool input_flow::is_hpd_plugged(bool *plugged, cap_error *err) {
  if (hpd_control::has_hpd(id_)) {
    *plugged = hpd_->is_plugged(id_);
    return true;
  }
  uint16_t out = 0;
  if (!mux_->get_output(&out, err)) return false;
  *plugged = !(out & mux_io::MASK_VGA_BLOCK_SOURCE);
  return true;
}

bool input_flow::set_hpd(bool plugged, cap_error *err) {
  if (hpd_control::has_hpd(id_)) {
    if (plugged) hpd_->plug(id_);
    else hpd_->unplug(id_);
    return true;
  }
  // VGA: blocking the RGB source emulates an unplug.
  if (plugged) return mux_->clear_output_mask(mux_io::MASK_VGA_BLOCK_SOURCE, err);
  return mux_->set_output_mask(mux_io::MASK_VGA_BLOCK_SOURCE, err);
}

bool input_flow::is_plugged(bool *plugged, cap_error *err) { return is_hpd_plugged(plugged, err); }
bool input_flow::plug(cap_error *err) { return set_hpd(true, err); }
bool input_flow::unplug(cap_error *err) { return set_hpd(false, err); }

bool input_flow::is_physical_plugged(bool *plugged, cap_error *err) {
  if (id_ == CONN_VGA) return static_cast<vga_link_fsm*>(fsm_.get())->is_physical_plugged(plugged, err);
  return rx_->is_cable_powered(plugged, err);
}

bool input_flow::fire_hpd_pulse(uint32_t deassert_us, uint32_t assert_us, int repeat_count, int end_level,
                                cap_error *err) {
  if (!hpd_control::has_hpd(id_))
    return cap_fail(err, cap_err_kind::UNSUPPORTED, "%s has no HPD line", connector_name(id_));
  return hpd_->fire_pulse(id_, deassert_us, assert_us, repeat_count, end_level, err);
}

bool input_flow::fire_mixed_hpd_pulses(const std::vector<uint32_t> &widths_us, cap_error *err) {
  if (!hpd_control::has_hpd(id_))
    return cap_fail(err, cap_err_kind::UNSUPPORTED, "%s has no HPD line", connector_name(id_));
  return hpd_->fire_mixed_pulses(id_, widths_us.data(), widths_us.size(), err);
}

bool input_flow::wait_video_input_stable(uint32_t timeout_ms, bool *stable, cap_error *err) {
  if (!timeout_ms) timeout_ms = rx_->stable_timeout_ms();
  return rx_->wait_video_input_stable(timeout_ms, stable, err);
}

bool input_flow::detect_resolution(uint32_t *w, uint32_t *h, cap_error *err) {
  bool locked = false;
  if (!fsm_)
    return cap_fail(err, cap_err_kind::INVALID_STATE, "%s: no link FSM", connector_name(id_));
  if (!fsm_->wait_lock(fsm_->timing().lock_timeout_ms, &locked, err)) return false;
  if (id_ == CONN_VGA) {
    if (!locked) return cap_fail(err, cap_err_kind::TIMEOUT, "Timeout waiting video output stable");
    if (!fpga_resolution(w, h, err)) return false;
    if (*w == 0 || *h == 0)
      return cap_fail(err, cap_err_kind::FSM_FAILURE, "Something wrong with the resolution: %ux%u", *w, *h);
    return true;
  }
  if (!locked) {
    uint32_t rw = 0, rh = 0, fw = 0, fh = 0;
    if (!rx_->frame_resolution(&rw, &rh, err)) return false;
    if (!fpga_resolution(&fw, &fh, err)) return false;
    return cap_fail(err, cap_err_kind::FSM_FAILURE, "Frame resolution not stable. Rx:%ux%u, FPGA:%ux%u",
                    rw, rh, fw, fh);
  }
  return rx_->frame_resolution(w, h, err);
}

bool input_flow::set_vga_mode(const std::string &mode, cap_error *err) {
  if (id_ != CONN_VGA)
    return cap_fail(err, cap_err_kind::UNSUPPORTED, "%s is not a VGA input", connector_name(id_));
  return static_cast<vga_link_fsm*>(fsm_.get())->set_mode(mode, err);
}
