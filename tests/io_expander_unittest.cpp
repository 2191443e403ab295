#include <gtest/gtest.h>

#include "fake_hw.h"
#include "io_expander.h"
#include "linux_i2c.h"

namespace {

TEST(IoExpanderTest, PairsAreLittleEndian) {
  fake_reg_bus bus;
  io_expander io(&bus);
  cap_error err;
  bus.regs[0] = 0x34;
  bus.regs[1] = 0x12;
  uint16_t v = 0;
  ASSERT_TRUE(io.get_input(&v, &err));
  EXPECT_EQ(0x1234, v);

  ASSERT_TRUE(io.set_output(0xabcd, &err));
  EXPECT_EQ(0xcd, bus.regs[2]);
  EXPECT_EQ(0xab, bus.regs[3]);

  ASSERT_TRUE(io.set_direction(0x0102, &err));
  EXPECT_EQ(0x02, bus.regs[6]);
  EXPECT_EQ(0x01, bus.regs[7]);
}

TEST(IoExpanderTest, MaskHelpersKeepOtherBits) {
  fake_reg_bus bus;
  io_expander io(&bus);
  cap_error err;
  ASSERT_TRUE(io.set_output(0x8001, &err));
  ASSERT_TRUE(io.set_output_mask(0x0100, &err));
  uint16_t v = 0;
  ASSERT_TRUE(io.get_output(&v, &err));
  EXPECT_EQ(0x8101, v);
  ASSERT_TRUE(io.clear_output_mask(0x8000, &err));
  ASSERT_TRUE(io.get_output(&v, &err));
  EXPECT_EQ(0x0101, v);
}

TEST(MuxIoTest, ConfigKeepsBitsAboveMask) {
  fake_reg_bus bus;
  mux_io mux(&bus);
  cap_error err;
  ASSERT_TRUE(mux.initialize(&err));
  ASSERT_TRUE(mux.set_output_mask(mux_io::MASK_VGA_BLOCK_SOURCE, &err));
  ASSERT_TRUE(mux.set_config_for(CONN_HDMI, &err));
  uint16_t v = 0;
  ASSERT_TRUE(mux.get_output(&v, &err));
  EXPECT_EQ(mux_io::config_for(CONN_HDMI), v & mux_io::CONFIG_MASK);
  EXPECT_TRUE(v & mux_io::MASK_VGA_BLOCK_SOURCE);
  EXPECT_TRUE(v & mux_io::MASK_LED_GREEN);

  ASSERT_TRUE(mux.set_config_for(CONN_DP1, &err));
  ASSERT_TRUE(mux.get_output(&v, &err));
  EXPECT_EQ(0, v & mux_io::CONFIG_MASK);
  EXPECT_TRUE(v & mux_io::MASK_DP1_EDID_SRAM_MUX);
}

TEST(PowerIoTest, InitializeEnablesRailsAndReleasesResets) {
  fake_reg_bus bus;
  power_io power(&bus);
  cap_error err;
  ASSERT_TRUE(power.initialize(&err));
  uint16_t dir = (uint16_t)(bus.regs[6] | (bus.regs[7] << 8));
  EXPECT_EQ(power_io::MASK_DP1_INT_L | power_io::MASK_DP2_INT_L | power_io::MASK_HDMI_INT_L, dir);
  uint16_t out = 0;
  ASSERT_TRUE(power.get_output(&out, &err));
  EXPECT_TRUE(out & power_io::MASK_EN_PP3300);
  EXPECT_TRUE(out & power_io::MASK_HDMI_RST_L);
  EXPECT_TRUE(out & power_io::MASK_VGA_RST_L);
}

TEST(PowerIoTest, ResetPulsesOnlyThatReceiver) {
  fake_reg_bus bus;
  power_io power(&bus);
  cap_error err;
  ASSERT_TRUE(power.initialize(&err));
  bus.writes.clear();
  ASSERT_TRUE(power.reset_receiver(CONN_DP2, &err));
  // Two pair writes: reset asserted, then released.
  ASSERT_EQ(4u, bus.writes.size());
  uint16_t asserted = (uint16_t)(bus.writes[0].second | (bus.writes[1].second << 8));
  uint16_t released = (uint16_t)(bus.writes[2].second | (bus.writes[3].second << 8));
  EXPECT_FALSE(asserted & power_io::MASK_DP2_RST_L);
  EXPECT_TRUE(asserted & power_io::MASK_DP1_RST_L);
  EXPECT_TRUE(released & power_io::MASK_DP2_RST_L);
}

TEST(PowerIoTest, BusFailureIsReported) {
  fake_reg_bus bus;
  power_io power(&bus);
  bus.fail = true;
  cap_error err;
  EXPECT_FALSE(power.initialize(&err));
  EXPECT_EQ(cap_err_kind::BUS, err.kind);
}

TEST(I2cSlaveTest, RetriesResetTheBus) {
  i2c_bus bus(250);
  int resets = 0;
  bus.set_resetter([&resets]() { resets++; });
  i2c_slave slave(&bus, 0x20);
  slave.retry_count = 2;
  slave.retry_initial_delay_ms = 0;
  uint8_t v = 0;
  cap_error err;
  EXPECT_FALSE(slave.get(0, &v, &err));
  EXPECT_EQ(cap_err_kind::BUS, err.kind);
  EXPECT_EQ(2, resets);
}

}  // namespace
