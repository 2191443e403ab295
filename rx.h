#pragma once
#include <stdint.h>
#include <string>
#include <vector>

#include "capture_error.h"
#include "linux_i2c.h"

// Video receiver chip in front of the FPGA.
class rx_chip {
public:
  virtual ~rx_chip() {}

  virtual const char *name() const = 0;

  virtual bool initialize(bool dual, cap_error *err) = 0;
  virtual bool set_pixel_mode(bool dual, cap_error *err) = 0;
  virtual bool is_video_input_stable(bool *stable, cap_error *err) = 0;
  // Pixel clock in MHz, 0 when the chip has no reading.
  virtual bool pixel_clock_mhz(double *mhz, cap_error *err) = 0;
  virtual bool is_interlaced(bool *interlaced, cap_error *err) = 0;
  // UNSUPPORTED on chips that do not measure the active area.
  virtual bool frame_resolution(uint32_t *w, uint32_t *h, cap_error *err) = 0;

  virtual bool is_cable_powered(bool *powered, cap_error *err) { *powered = true; (void)err; return true; }
  virtual bool is_reset_needed(bool *needed, cap_error *err) { *needed = false; (void)err; return true; }
  virtual bool reset(cap_error *err) { (void)err; return true; }
  virtual bool reset_audio_logic(cap_error *err) {
    return cap_fail(err, cap_err_kind::UNSUPPORTED, "%s has no audio logic", name());
  }
  virtual bool dump_registers(std::vector<uint8_t> *out, cap_error *err) = 0;

  virtual uint32_t stable_probe_ms() const = 0;
  virtual uint32_t stable_timeout_ms() const = 0;

  // Polls is_video_input_stable(). A timeout is not an error: *stable = false.
  bool wait_video_input_stable(uint32_t timeout_ms, bool *stable, cap_error *err);
};

// ITE IT6506 DisplayPort receiver.
class dp_rx : public rx_chip {
public:
  static const uint8_t kSlaveAddresses[2];

  explicit dp_rx(reg_bus *bus) : bus_(bus) {}

  const char *name() const override { return "IT6506"; }
  bool initialize(bool dual, cap_error *err) override;
  bool set_pixel_mode(bool dual, cap_error *err) override;
  bool is_video_input_stable(bool *stable, cap_error *err) override;
  bool pixel_clock_mhz(double *mhz, cap_error *err) override;
  bool is_interlaced(bool *interlaced, cap_error *err) override;
  bool frame_resolution(uint32_t *w, uint32_t *h, cap_error *err) override;
  bool is_cable_powered(bool *powered, cap_error *err) override;
  bool dump_registers(std::vector<uint8_t> *out, cap_error *err) override;
  bool reset_audio_logic(cap_error *err) override;

  uint32_t stable_probe_ms() const override { return 1000; }
  uint32_t stable_timeout_ms() const override { return 5000; }

private:
  bool switch_bank(int bank, cap_error *err);
  bool write_seq(const uint8_t (*seq)[2], size_t n, cap_error *err);

  reg_bus *bus_;
};

// ITE IT6803 HDMI receiver.
class hdmi_rx : public rx_chip {
public:
  static const uint8_t kSlaveAddress = 0x48;

  explicit hdmi_rx(reg_bus *bus) : bus_(bus) {}

  const char *name() const override { return "IT6803"; }
  bool initialize(bool dual, cap_error *err) override;
  bool set_pixel_mode(bool dual, cap_error *err) override;
  bool is_video_input_stable(bool *stable, cap_error *err) override;
  bool pixel_clock_mhz(double *mhz, cap_error *err) override;
  bool is_interlaced(bool *interlaced, cap_error *err) override;
  bool frame_resolution(uint32_t *w, uint32_t *h, cap_error *err) override;
  bool is_cable_powered(bool *powered, cap_error *err) override;
  // Reads and clears the clock-change interrupts.
  bool is_reset_needed(bool *needed, cap_error *err) override;
  bool reset(cap_error *err) override;
  bool dump_registers(std::vector<uint8_t> *out, cap_error *err) override;
  bool reset_audio_logic(cap_error *err) override;

  uint32_t stable_probe_ms() const override { return 100; }
  uint32_t stable_timeout_ms() const override { return 10000; }

private:
  bool clear_interrupt(cap_error *err);
  bool load_pclk_base(cap_error *err);

  reg_bus *bus_;
  double pclk_base_ = 0.0;
};

// ITE CAT9883C analog (VGA) receiver.
class vga_rx : public rx_chip {
public:
  static const uint8_t kSlaveAddress = 0x4c;

  explicit vga_rx(reg_bus *bus) : bus_(bus) {}

  const char *name() const override { return "CAT9883C"; }
  bool initialize(bool dual, cap_error *err) override;
  bool set_pixel_mode(bool, cap_error *) override { return true; }
  // Sync detected and the hsync counter matches a known mode.
  bool is_video_input_stable(bool *stable, cap_error *err) override;
  bool pixel_clock_mhz(double *mhz, cap_error *) override { *mhz = 0.0; return true; }
  bool is_interlaced(bool *interlaced, cap_error *) override { *interlaced = false; return true; }
  bool frame_resolution(uint32_t *w, uint32_t *h, cap_error *err) override;
  bool dump_registers(std::vector<uint8_t> *out, cap_error *err) override;

  uint32_t stable_probe_ms() const override { return 100; }
  uint32_t stable_timeout_ms() const override { return 5000; }

  bool detect_mode(std::string *mode, cap_error *err);
  bool set_mode(const std::string &mode, cap_error *err);
  static bool mode_known(const std::string &mode);
  // Mode name for an hsync counter value, empty if none matches.
  static std::string mode_for_hsync_counter(uint32_t counter);

private:
  bool read_hsync_counter(uint32_t *counter, cap_error *err);

  reg_bus *bus_;
};
