#pragma once
#include <stdint.h>
#include <memory>
#include <string>

#include "capture_error.h"
#include "connector_ids.h"
#include "rx.h"

// Pixel clock band (MHz) inside which the pixel mode never changes.
struct pixel_mode_hysteresis {
  double low_mhz;
  double high_mhz;
};

// Above high selects dual, below low selects single, [low, high] keeps *dual.
// Returns true when *dual changed.
bool hysteresis_update(const pixel_mode_hysteresis &h, double pclk_mhz, bool *dual);

enum class link_fsm_state {
  NEEDS_RESET,
  STABILIZING_INPUT,
  SELECTING_PIXEL_MODE,
  SELECTING_PATH,
  VERIFYING_LOCK,
  LOCKED,
  FAILED,
};

const char *link_fsm_state_name(link_fsm_state s);

struct link_state {
  bool dual = false;
  double last_pclk_mhz = 0.0;
  bool locked = false;
};

// Board operations a link FSM drives; implemented by the input flow.
class link_port {
public:
  virtual ~link_port() {}
  // Pulses the receiver reset line and reinitializes it in the given mode.
  virtual bool reinit_receiver(bool dual, cap_error *err) = 0;
  // Routes muxes and FPGA dumpers for the given pixel mode.
  virtual bool select_path(bool dual, cap_error *err) = 0;
  // Frame resolution measured by the FPGA dumpers.
  virtual bool fpga_resolution(uint32_t *w, uint32_t *h, cap_error *err) = 0;
  virtual bool is_hpd_plugged(bool *plugged, cap_error *err) = 0;
  virtual bool set_hpd(bool plugged, cap_error *err) = 0;
};

struct link_fsm_timing {
  uint32_t lock_probe_ms;
  uint32_t lock_timeout_ms;
  uint32_t stable_timeout_ms;     // 0: receiver default
  uint32_t hpd_pulse_ms;
  uint32_t settle_ms;
  uint32_t resolution_probe_ms;   // gap between the two VGA resolution reads

  static link_fsm_timing dp() { return link_fsm_timing{1000, 5000, 0, 100, 0, 0}; }
  static link_fsm_timing hdmi() { return link_fsm_timing{100, 10000, 0, 0, 3000, 0}; }
  static link_fsm_timing vga() { return link_fsm_timing{100, 5000, 0, 0, 0, 50}; }
};

// Brings one receiver into a locked, known pixel mode. run() is a single pass:
// it ends LOCKED or returns false with a link, timeout or bus error.
class link_fsm {
public:
  link_fsm(const char *name, rx_chip *rx, link_port *port, bool initial_dual,
           const pixel_mode_hysteresis &hyst, const link_fsm_timing &timing);
  virtual ~link_fsm() {}

  bool run(cap_error *err);

  const link_state &state() const { return state_; }
  link_fsm_state current() const { return current_; }
  const char *name() const { return name_; }
  const pixel_mode_hysteresis &hysteresis() const { return hyst_; }
  const link_fsm_timing &timing() const { return timing_; }

  // Waits until the FPGA and receiver resolutions agree. A timeout leaves
  // *locked false.
  virtual bool wait_lock(uint32_t timeout_ms, bool *locked, cap_error *err);
  bool wait_input_stable(bool *stable, cap_error *err);

protected:
  virtual bool do_run(cap_error *err) = 0;

  void enter(link_fsm_state s);
  bool is_frame_locked(bool *locked, cap_error *err);
  // Reads the pixel clock and moves the receiver to the hysteresis result.
  bool select_pixel_mode(bool *changed, cap_error *err);
  // CableDisconnected, PortNotPlugged or GenericFSMFailure.
  bool fail_link(cap_error *err);
  bool fail_timeout(const char *what, cap_error *err);

  const char *name_;
  rx_chip *rx_;
  link_port *port_;
  pixel_mode_hysteresis hyst_;
  link_fsm_timing timing_;
  link_state state_;
  link_fsm_state current_ = link_fsm_state::NEEDS_RESET;
};

class dp_link_fsm : public link_fsm {
public:
  dp_link_fsm(rx_chip *rx, link_port *port, const pixel_mode_hysteresis &hyst,
              const link_fsm_timing &timing = link_fsm_timing::dp())
      : link_fsm("DP", rx, port, false, hyst, timing) {}

  static pixel_mode_hysteresis default_hysteresis() { return pixel_mode_hysteresis{180, 200}; }

protected:
  bool do_run(cap_error *err) override;
};

class hdmi_link_fsm : public link_fsm {
public:
  hdmi_link_fsm(rx_chip *rx, link_port *port, const pixel_mode_hysteresis &hyst,
                const link_fsm_timing &timing = link_fsm_timing::hdmi())
      : link_fsm("HDMI", rx, port, true, hyst, timing) {}

  static pixel_mode_hysteresis default_hysteresis() { return pixel_mode_hysteresis{126, 130}; }

protected:
  bool do_run(cap_error *err) override;
};

// VGA has no HPD line; "plugged" means the RGB source is not blocked.
class vga_link_fsm : public link_fsm {
public:
  vga_link_fsm(vga_rx *rx, link_port *port, const link_fsm_timing &timing = link_fsm_timing::vga())
      : link_fsm("VGA", rx, port, false, pixel_mode_hysteresis{0, 0}, timing), vga_(rx) {}

  // "auto" (case-insensitive) detects the mode on every run, anything else pins it.
  bool set_mode(const std::string &mode, cap_error *err);
  bool auto_mode() const { return auto_mode_; }
  // Forces plug, samples input stability, restores the previous plug state.
  bool is_physical_plugged(bool *plugged, cap_error *err);

  // Two FPGA resolution reads resolution_probe_ms apart agree and are non-zero.
  bool wait_lock(uint32_t timeout_ms, bool *locked, cap_error *err) override;

protected:
  bool do_run(cap_error *err) override;

private:
  bool is_resolution_valid(bool *valid, cap_error *err);

  vga_rx *vga_;
  bool auto_mode_ = true;
};

std::unique_ptr<link_fsm> make_link_fsm(connector_id id, rx_chip *rx, link_port *port,
                                        const pixel_mode_hysteresis &hyst);
