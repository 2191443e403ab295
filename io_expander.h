#pragma once
#include <stdint.h>

#include "capture_error.h"
#include "connector_ids.h"
#include "linux_i2c.h"

// TCA6416A 16-bit I/O expander. Port pairs are little endian (low byte first).
class io_expander {
public:
  explicit io_expander(reg_bus *bus) : bus_(bus) {}
  virtual ~io_expander() {}

  bool get_input(uint16_t *v, cap_error *err) { return read_pair(kInputBase, v, err); }
  bool get_output(uint16_t *v, cap_error *err) { return read_pair(kOutputBase, v, err); }
  bool set_output(uint16_t v, cap_error *err) { return write_pair(kOutputBase, v, err); }
  // 1 = input, 0 = output.
  bool set_direction(uint16_t v, cap_error *err) { return write_pair(kConfigBase, v, err); }
  bool set_output_mask(uint16_t mask, cap_error *err);
  bool clear_output_mask(uint16_t mask, cap_error *err);

protected:
  static const uint8_t kInputBase = 0;
  static const uint8_t kOutputBase = 2;
  static const uint8_t kConfigBase = 6;

  bool read_pair(uint8_t base, uint16_t *v, cap_error *err);
  bool write_pair(uint8_t base, uint16_t v, cap_error *err);

  reg_bus *bus_;
};

// Power rails and receiver reset lines.
class power_io : public io_expander {
public:
  static const uint8_t kSlaveAddress = 0x20;

  static const uint16_t MASK_EN_PP3300 = 1 << 1;
  static const uint16_t MASK_EN_PP1800 = 1 << 2;
  static const uint16_t MASK_EN_PP1200 = 1 << 3;
  static const uint16_t MASK_DP1_RST_L = 1 << 4;
  static const uint16_t MASK_DP2_RST_L = 1 << 5;
  static const uint16_t MASK_HDMI_RST_L = 1 << 6;
  static const uint16_t MASK_VGA_RST_L = 1 << 7;
  static const uint16_t MASK_DP1_INT_L = 1 << 8;
  static const uint16_t MASK_DP2_INT_L = 1 << 9;
  static const uint16_t MASK_HDMI_INT_L = 1 << 10;

  explicit power_io(reg_bus *bus) : io_expander(bus) {}

  // Enables all rails and releases every receiver from reset.
  bool initialize(cap_error *err);
  // Pulses the receiver's active-low reset line, then waits for it to boot.
  bool reset_receiver(connector_id id, cap_error *err);
};

// Video/audio path muxes between receivers and the FPGA.
class mux_io : public io_expander {
public:
  static const uint8_t kSlaveAddress = 0x21;

  static const uint16_t MASK_RX_A_MUX_S0 = 1 << 1;
  static const uint16_t MASK_RX_A_MUX_S1 = 1 << 2;
  static const uint16_t MASK_RX_B_MUX_OE_L = 1 << 3;
  static const uint16_t MASK_RX_B_MUX_S0 = 1 << 4;
  static const uint16_t MASK_RX_B_MUX_S1 = 1 << 5;
  static const uint16_t MASK_I2S_MUX_S0 = 1 << 7;
  static const uint16_t MASK_I2S_MUX_S1 = 1 << 8;
  static const uint16_t MASK_DP1_EDID_SRAM_MUX = 1 << 12;
  static const uint16_t MASK_DP2_EDID_SRAM_MUX = 1 << 13;
  static const uint16_t MASK_VGA_BLOCK_SOURCE = 1 << 14;
  static const uint16_t MASK_LED_GREEN = 1 << 15;

  static const uint16_t CONFIG_MASK = 0x1ff;

  explicit mux_io(reg_bus *bus) : io_expander(bus) {}

  bool initialize(cap_error *err);
  // Routes the connector's video and audio to the FPGA (dual-pixel wiring).
  bool set_config_for(connector_id id, cap_error *err);

  static uint16_t config_for(connector_id id);
};
