#include <gtest/gtest.h>

#include "fake_hw.h"
#include "link_fsm.h"

namespace {

// Short probes so failing paths finish in milliseconds.
link_fsm_timing fast_timing() { return link_fsm_timing{1, 20, 5, 1, 0, 1}; }

TEST(HysteresisTest, InBandNeverFlips) {
  pixel_mode_hysteresis h = hdmi_link_fsm::default_hysteresis();
  for (bool start : {false, true}) {
    bool dual = start;
    for (double p = 126.0; p <= 130.0; p += 0.5) {
      EXPECT_FALSE(hysteresis_update(h, p, &dual));
      EXPECT_EQ(start, dual);
    }
  }
}

TEST(HysteresisTest, FullCrossingsFlipTwice) {
  pixel_mode_hysteresis h = dp_link_fsm::default_hysteresis();
  bool dual = false;
  int flips = 0;
  const double seq[] = {100, 190, 210, 195, 185, 170, 190, 100};
  for (double p : seq)
    if (hysteresis_update(h, p, &dual)) flips++;
  EXPECT_EQ(2, flips);
  EXPECT_FALSE(dual);
}

TEST(HysteresisTest, HdmiSingleToDualThenHolds) {
  pixel_mode_hysteresis h = hdmi_link_fsm::default_hysteresis();
  bool dual = false;
  EXPECT_TRUE(hysteresis_update(h, 135.0, &dual));
  EXPECT_TRUE(dual);
  EXPECT_FALSE(hysteresis_update(h, 128.0, &dual));
  EXPECT_TRUE(dual);
}

TEST(HdmiLinkFsmTest, PixelModeFollowsClock) {
  fake_rx rx;
  fake_link_port port(&rx);
  hdmi_link_fsm fsm(&rx, &port, hdmi_link_fsm::default_hysteresis(), fast_timing());
  EXPECT_TRUE(fsm.state().dual);

  cap_error err;
  rx.pclk_mhz = 100.0;
  ASSERT_TRUE(fsm.run(&err)) << err.msg;
  EXPECT_FALSE(fsm.state().dual);
  EXPECT_FALSE(port.path_dual);
  EXPECT_EQ(link_fsm_state::LOCKED, fsm.current());

  rx.pclk_mhz = 135.0;
  ASSERT_TRUE(fsm.run(&err)) << err.msg;
  EXPECT_TRUE(fsm.state().dual);
  EXPECT_TRUE(port.path_dual);

  rx.pclk_mhz = 128.0;
  ASSERT_TRUE(fsm.run(&err)) << err.msg;
  EXPECT_TRUE(fsm.state().dual);
  EXPECT_EQ(2, rx.pixel_mode_calls);
  EXPECT_EQ(2, port.path_calls);
}

TEST(HdmiLinkFsmTest, ResetWhenClockChanged) {
  fake_rx rx;
  fake_link_port port(&rx);
  hdmi_link_fsm fsm(&rx, &port, hdmi_link_fsm::default_hysteresis(), fast_timing());
  rx.pclk_mhz = 140.0;
  rx.reset_needed = true;
  cap_error err;
  ASSERT_TRUE(fsm.run(&err)) << err.msg;
  EXPECT_EQ(1, rx.reset_calls);
  EXPECT_EQ(0, rx.pixel_mode_calls);
}

TEST(HdmiLinkFsmTest, LockTimeoutCarriesRegisterDump) {
  fake_rx rx;
  fake_link_port port(&rx);
  hdmi_link_fsm fsm(&rx, &port, hdmi_link_fsm::default_hysteresis(), fast_timing());
  rx.pclk_mhz = 100.0;
  port.fpga_w = 1280;
  cap_error err;
  EXPECT_FALSE(fsm.run(&err));
  EXPECT_EQ(cap_err_kind::TIMEOUT, err.kind);
  EXPECT_EQ(256u, err.reg_dump.size());
  EXPECT_EQ(link_fsm_state::FAILED, fsm.current());
}

TEST(HdmiLinkFsmTest, UnstableInputIsLinkFailure) {
  fake_rx rx;
  fake_link_port port(&rx);
  hdmi_link_fsm fsm(&rx, &port, hdmi_link_fsm::default_hysteresis(), fast_timing());
  rx.stable = false;
  rx.cable_powered = false;
  cap_error err;
  EXPECT_FALSE(fsm.run(&err));
  EXPECT_EQ(cap_err_kind::CABLE_DISCONNECTED, err.kind);
}

TEST(DpLinkFsmTest, LockedAndUnchangedSkipsReset) {
  fake_rx rx;
  fake_link_port port(&rx);
  dp_link_fsm fsm(&rx, &port, dp_link_fsm::default_hysteresis(), fast_timing());
  cap_error err;
  ASSERT_TRUE(fsm.run(&err)) << err.msg;
  EXPECT_EQ(0, port.reinit_calls);
  EXPECT_EQ(0, port.path_calls);
  EXPECT_TRUE(port.hpd_writes.empty());
}

TEST(DpLinkFsmTest, ModeChangeOnLockedLinkReroutes) {
  fake_rx rx;
  fake_link_port port(&rx);
  dp_link_fsm fsm(&rx, &port, dp_link_fsm::default_hysteresis(), fast_timing());
  rx.pclk_mhz = 240.0;
  cap_error err;
  ASSERT_TRUE(fsm.run(&err)) << err.msg;
  EXPECT_TRUE(fsm.state().dual);
  EXPECT_EQ(1, port.path_calls);
  EXPECT_TRUE(port.path_dual);
  EXPECT_EQ(0, port.reinit_calls);
}

TEST(DpLinkFsmTest, HpdPulseRecoversSource) {
  fake_rx rx;
  fake_link_port port(&rx);
  dp_link_fsm fsm(&rx, &port, dp_link_fsm::default_hysteresis(), fast_timing());
  rx.stable = false;
  port.on_plug = [&rx]() { rx.stable = true; };
  cap_error err;
  ASSERT_TRUE(fsm.run(&err)) << err.msg;
  EXPECT_EQ(1, port.reinit_calls);
  ASSERT_EQ(2u, port.hpd_writes.size());
  EXPECT_FALSE(port.hpd_writes[0]);
  EXPECT_TRUE(port.hpd_writes[1]);
  EXPECT_EQ(1, port.path_calls);
}

TEST(DpLinkFsmTest, FailureDisambiguation) {
  {
    fake_rx rx;
    fake_link_port port(&rx);
    dp_link_fsm fsm(&rx, &port, dp_link_fsm::default_hysteresis(), fast_timing());
    rx.stable = false;
    rx.cable_powered = false;
    cap_error err;
    EXPECT_FALSE(fsm.run(&err));
    EXPECT_EQ(cap_err_kind::CABLE_DISCONNECTED, err.kind);
  }
  {
    fake_rx rx;
    fake_link_port port(&rx);
    dp_link_fsm fsm(&rx, &port, dp_link_fsm::default_hysteresis(), fast_timing());
    rx.stable = false;
    // The port drops HPD again right after the pulse.
    port.on_plug = [&port]() { port.hpd = false; };
    cap_error err;
    EXPECT_FALSE(fsm.run(&err));
    EXPECT_EQ(cap_err_kind::PORT_NOT_PLUGGED, err.kind);
  }
  {
    fake_rx rx;
    fake_link_port port(&rx);
    dp_link_fsm fsm(&rx, &port, dp_link_fsm::default_hysteresis(), fast_timing());
    rx.stable = false;
    cap_error err;
    EXPECT_FALSE(fsm.run(&err));
    EXPECT_EQ(cap_err_kind::FSM_FAILURE, err.kind);
    EXPECT_EQ(link_fsm_state::FAILED, fsm.current());
  }
}

TEST(VgaLinkFsmTest, SetModeAutoAndPinned) {
  fake_reg_bus bus;
  vga_rx rx(&bus);
  fake_rx dummy;
  fake_link_port port(&dummy);
  vga_link_fsm fsm(&rx, &port, fast_timing());
  cap_error err;

  ASSERT_TRUE(fsm.set_mode("PC_1024x768x60", &err)) << err.msg;
  EXPECT_FALSE(fsm.auto_mode());
  EXPECT_EQ(19u, bus.writes.size());

  ASSERT_TRUE(fsm.set_mode("AUTO", &err));
  EXPECT_TRUE(fsm.auto_mode());

  EXPECT_FALSE(fsm.set_mode("PC_1x1x1", &err));
  EXPECT_EQ(cap_err_kind::INVALID_ARGUMENT, err.kind);
  EXPECT_TRUE(fsm.auto_mode());
}

TEST(VgaLinkFsmTest, AutoDetectsModeAndLocks) {
  fake_reg_bus bus;
  vga_rx rx(&bus);
  fake_rx dummy;
  fake_link_port port(&dummy);
  vga_link_fsm fsm(&rx, &port, fast_timing());
  bus.regs[0x14] = 0x80 | 0x10;
  // Counter 0x460 falls in the 1920x1080 band.
  bus.regs[0xac] = 0x40;
  bus.regs[0xab] = 0x60;
  cap_error err;
  ASSERT_TRUE(fsm.run(&err)) << err.msg;
  EXPECT_EQ(link_fsm_state::LOCKED, fsm.current());

  port.fpga_w = 0;
  EXPECT_FALSE(fsm.run(&err));
  EXPECT_EQ(cap_err_kind::TIMEOUT, err.kind);
}

TEST(VgaLinkFsmTest, NoSyncWithoutSourceIsCableDisconnected) {
  fake_reg_bus bus;
  vga_rx rx(&bus);
  fake_rx dummy;
  fake_link_port port(&dummy);
  vga_link_fsm fsm(&rx, &port, fast_timing());
  port.hpd = false;
  cap_error err;
  EXPECT_FALSE(fsm.run(&err));
  EXPECT_EQ(cap_err_kind::CABLE_DISCONNECTED, err.kind);
  // The physical probe restores the unplugged state.
  EXPECT_FALSE(port.hpd);
}

TEST(MakeLinkFsmTest, MatchesConnector) {
  fake_rx rx;
  fake_link_port port(&rx);
  pixel_mode_hysteresis h = dp_link_fsm::default_hysteresis();
  EXPECT_STREQ("DP", make_link_fsm(CONN_DP2, &rx, &port, h)->name());
  EXPECT_STREQ("HDMI", make_link_fsm(CONN_HDMI, &rx, &port, h)->name());
  EXPECT_EQ(nullptr, make_link_fsm(CONN_VGA, &rx, &port, h));
}

}  // namespace
