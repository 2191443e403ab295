#pragma once
#include <stdint.h>
#include <memory>
#include <string>

#include "capture_error.h"
#include "connector_ids.h"
#include "field_manager.h"
#include "frame_manager.h"
#include "hpd_control.h"
#include "io_expander.h"
#include "link_fsm.h"
#include "rx.h"

struct input_flow_options {
  field_manager_options fields;
  // Ignored for VGA.
  pixel_mode_hysteresis hysteresis = {0, 0};
};

// Everything between one input connector and the FPGA dumpers: receiver,
// HPD (or the VGA source block), muxes, link FSM and the frame manager.
class input_flow : public link_port {
public:
  input_flow(connector_id id, std::unique_ptr<rx_chip> rx, hpd_control *hpd, power_io *power,
             mux_io *mux, video_dumper *dumper_a, video_dumper *dumper_b,
             pixel_dump_tool *pixdump, histogram_tool *hist, const input_flow_options &opt);

  connector_id id() const { return id_; }
  const char *connector_type() const;
  bool has_audio() const { return id_ == CONN_HDMI; }

  // Resets the receiver and initializes it in the current pixel mode.
  bool initialize(cap_error *err);
  // Routes muxes and dumpers to this flow.
  bool select(cap_error *err);
  bool do_fsm(cap_error *err);

  bool is_plugged(bool *plugged, cap_error *err);
  bool plug(cap_error *err);
  bool unplug(cap_error *err);
  bool is_physical_plugged(bool *plugged, cap_error *err);
  bool fire_hpd_pulse(uint32_t deassert_us, uint32_t assert_us, int repeat_count, int end_level,
                      cap_error *err);
  bool fire_mixed_hpd_pulses(const std::vector<uint32_t> &widths_us, cap_error *err);
  bool wait_video_input_stable(uint32_t timeout_ms, bool *stable, cap_error *err);
  bool detect_resolution(uint32_t *w, uint32_t *h, cap_error *err);
  bool set_vga_mode(const std::string &mode, cap_error *err);
  bool reset_audio_logic(cap_error *err) { return rx_->reset_audio_logic(err); }

  bool is_dual() const { return fsm_ ? fsm_->state().dual : false; }
  link_fsm *fsm() { return fsm_.get(); }
  rx_chip *rx() { return rx_.get(); }
  field_manager *fields() { return &fields_; }
  frame_manager *frames() { return &frames_; }

  // link_port
  bool reinit_receiver(bool dual, cap_error *err) override;
  bool select_path(bool dual, cap_error *err) override;
  bool fpga_resolution(uint32_t *w, uint32_t *h, cap_error *err) override;
  bool is_hpd_plugged(bool *plugged, cap_error *err) override;
  bool set_hpd(bool plugged, cap_error *err) override;

private:
  connector_id id_;
  std::unique_ptr<rx_chip> rx_;
  hpd_control *hpd_;
  power_io *power_;
  mux_io *mux_;
  field_manager fields_;
  frame_manager frames_;
  std::unique_ptr<link_fsm> fsm_;
};
