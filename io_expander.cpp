#include "io_expander.h"

#include <cstdio>

#include "wait_util.h"

bool io_expander::read_pair(uint8_t base, uint16_t *v, cap_error *err) {
  std::vector<uint8_t> b;
  if (!bus_->get_block(base, 2, &b, err)) return false;
  if (b.size() != 2)
    return cap_fail(err, cap_err_kind::BUS, "short read from expander reg 0x%02x", base);
  *v = (uint16_t)(b[0] | (b[1] << 8));
  return true;
}

bool io_expander::write_pair(uint8_t base, uint16_t v, cap_error *err) {
  uint8_t b[2] = {(uint8_t)(v & 0xff), (uint8_t)(v >> 8)};
  return bus_->set(base, b, 2, err);
}

bool io_expander::set_output_mask(uint16_t mask, cap_error *err) {
  uint16_t v = 0;
  if (!get_output(&v, err)) return false;
  return set_output(v | mask, err);
}

bool io_expander::clear_output_mask(uint16_t mask, cap_error *err) {
  uint16_t v = 0;
  if (!get_output(&v, err)) return false;
  return set_output(v & ~mask, err);
}

static const uint16_t POWER_ALL_ON =
    power_io::MASK_EN_PP3300 | power_io::MASK_EN_PP1800 | power_io::MASK_EN_PP1200 |
    power_io::MASK_DP1_RST_L | power_io::MASK_DP2_RST_L | power_io::MASK_HDMI_RST_L |
    power_io::MASK_VGA_RST_L;

bool power_io::initialize(cap_error *err) {
  fprintf(stderr, "[io] initialize power expander\n");
  if (!set_direction(MASK_DP1_INT_L | MASK_DP2_INT_L | MASK_HDMI_INT_L, err)) return false;
  if (set_output(POWER_ALL_ON, nullptr)) return true;
  // Receivers may hold the bus low for a few ms on first power-up.
  fprintf(stderr, "[io] re-enable receiver power\n");
  return set_output(POWER_ALL_ON, err);
}

bool power_io::reset_receiver(connector_id id, cap_error *err) {
  uint16_t mask = 0;
  switch (id) {
    case CONN_DP1: mask = MASK_DP1_RST_L; break;
    case CONN_DP2: mask = MASK_DP2_RST_L; break;
    case CONN_HDMI: mask = MASK_HDMI_RST_L; break;
    case CONN_VGA: mask = MASK_VGA_RST_L; break;
  }
  if (!mask) return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "no receiver for connector %d", (int)id);
  if (!clear_output_mask(mask, err)) return false;
  sleep_ms(1);
  if (!set_output_mask(mask, err)) return false;
  sleep_ms(100);
  return true;
}

bool mux_io::initialize(cap_error *err) {
  fprintf(stderr, "[io] initialize mux expander\n");
  if (!set_direction(0, err)) return false;
  return set_output(MASK_DP1_EDID_SRAM_MUX | MASK_DP2_EDID_SRAM_MUX | MASK_LED_GREEN, err);
}

uint16_t mux_io::config_for(connector_id id) {
  switch (id) {
    case CONN_DP1: return 0;
    case CONN_DP2: return MASK_RX_A_MUX_S0 | MASK_RX_B_MUX_S0 | MASK_I2S_MUX_S0;
    case CONN_HDMI: return MASK_RX_A_MUX_S1 | MASK_RX_B_MUX_S1 | MASK_I2S_MUX_S1;
    case CONN_VGA: return MASK_RX_A_MUX_S0 | MASK_RX_A_MUX_S1 | MASK_RX_B_MUX_OE_L;
  }
  return 0;
}

bool mux_io::set_config_for(connector_id id, cap_error *err) {
  uint16_t v = 0;
  if (!get_output(&v, err)) return false;
  return set_output((uint16_t)((v & ~CONFIG_MASK) | config_for(id)), err);
}
