#include <gtest/gtest.h>

#include <stdio.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <memory>
#include <string>

#include "audio_capture.h"
#include "capture_service.h"
#include "fake_hw.h"
#include "hpd_control.h"
#include "input_flow.h"
#include "video_dumper.h"
#include "wait_util.h"

namespace {

const uint32_t kW = 64, kH = 8;

bool file_exists(const std::string &path) {
  struct stat st;
  return stat(path.c_str(), &st) == 0;
}

capture_area sized(uint32_t w, uint32_t h) {
  capture_area a;
  a.has_w = a.has_h = true;
  a.w = w;
  a.h = h;
  return a;
}

// A DP1 and an HDMI flow over fake registers; only DP1 carries video.
class CaptureServiceTest : public ::testing::Test {
protected:
  CaptureServiceTest()
    : a_(&mem_, 0), b_(&mem_, 1), hpd_(&mem_), adump_(&mem_), audio_mgr_(&adump_, &pixdump_, 2),
      svc_(options()) {}

  capture_service_options options() {
    char tmpl[] = "/tmp/capture_service_test_XXXXXX";
    char *dir = mkdtemp(tmpl);
    dir_ = dir ? dir : "/tmp";
    capture_service_options opt;
    opt.max_captured_frames = 100;
    opt.frame_dump_timeout_ms = 500;
    opt.thumbnail_dir = dir_ + "/thumbs";
    opt.audio_dump_dir = dir_;
    return opt;
  }

  void SetUp() override {
    input_flow_options fopt;
    fopt.fields.probe_delay_ms = 1;

    fopt.hysteresis = dp_link_fsm::default_hysteresis();
    dp_rx_ = new fake_rx();
    dp_rx_->width = kW;
    dp_rx_->height = kH;
    dp_.reset(new input_flow(CONN_DP1, std::unique_ptr<rx_chip>(dp_rx_), &hpd_, nullptr, nullptr, &a_, &b_,
                             &pixdump_, &hist_, fopt));

    fopt.hysteresis = hdmi_link_fsm::default_hysteresis();
    hdmi_rx_ = new fake_rx();
    hdmi_.reset(new input_flow(CONN_HDMI, std::unique_ptr<rx_chip>(hdmi_rx_), &hpd_, nullptr, nullptr, &a_, &b_,
                               &pixdump_, &hist_, fopt));

    svc_.add_flow(dp_.get());
    svc_.add_flow(hdmi_.get());
    svc_.set_audio(&audio_mgr_);

    mem_.set_dumper(0, kW, kH, 0);
    hpd_.plug(CONN_DP1);
  }

  void TearDown() override {
    std::string cmd = "rm -rf '" + dir_ + "'";
    if (system(cmd.c_str()) != 0) fprintf(stderr, "cleanup of %s failed\n", dir_.c_str());
  }

  void set_field_count(uint32_t n) { mem_.poke(fake_regs::kDumperBase[0] + fake_regs::FIELD_COUNT, n); }

  std::string dir_;
  fake_fpga_mem mem_;
  video_dumper a_, b_;
  hpd_control hpd_;
  fake_pixel_dump pixdump_;
  fake_histogram hist_;
  audio_dumper adump_;
  audio_capture_manager audio_mgr_;
  fake_rx *dp_rx_ = nullptr;
  fake_rx *hdmi_rx_ = nullptr;
  std::unique_ptr<input_flow> dp_, hdmi_;
  capture_service svc_;
};

TEST_F(CaptureServiceTest, InputsAndConnectorTypes) {
  std::vector<int> inputs = svc_.supported_inputs();
  ASSERT_EQ(2u, inputs.size());
  EXPECT_EQ(1, inputs[0]);
  EXPECT_EQ(3, inputs[1]);

  std::string type;
  cap_error err;
  ASSERT_TRUE(svc_.connector_type(3, &type, &err));
  EXPECT_EQ("HDMI", type);
  EXPECT_FALSE(svc_.connector_type(9, &type, &err));
  EXPECT_EQ(cap_err_kind::INVALID_ARGUMENT, err.kind);
}

TEST_F(CaptureServiceTest, PlugStateFollowsHpd) {
  cap_error err;
  bool plugged = false;
  ASSERT_TRUE(svc_.is_plugged(1, &plugged, &err));
  EXPECT_TRUE(plugged);
  ASSERT_TRUE(svc_.unplug(1, &err));
  ASSERT_TRUE(svc_.is_plugged(1, &plugged, &err));
  EXPECT_FALSE(plugged);
  EXPECT_EQ(0u, mem_.peek(fake_regs::HPD_BASE + 0x4));
  ASSERT_TRUE(svc_.plug(1, &err));
  EXPECT_EQ(1u, mem_.peek(fake_regs::HPD_BASE + 0x4));
}

TEST_F(CaptureServiceTest, MixedPulsesUseMilliseconds) {
  cap_error err;
  uint64_t t0 = monotonic_ms();
  ASSERT_TRUE(svc_.fire_mixed_hpd_pulses(1, {2, 3}, &err)) << err.msg;
  EXPECT_GE(monotonic_ms() - t0, 5u);
  // Two segments end low.
  EXPECT_EQ(0u, mem_.peek(fake_regs::HPD_BASE + 0x4));
}

TEST_F(CaptureServiceTest, PulseWidthBeyondMicrosecondRangeIsRejected) {
  cap_error err;
  uint64_t t0 = monotonic_ms();
  EXPECT_FALSE(svc_.fire_mixed_hpd_pulses(1, {1, 4294968}, &err));
  EXPECT_EQ(cap_err_kind::INVALID_ARGUMENT, err.kind);
  EXPECT_LT(monotonic_ms() - t0, 1000u);
  EXPECT_EQ(1u, mem_.peek(fake_regs::HPD_BASE + 0x4));
}

TEST_F(CaptureServiceTest, PartialAreaIsRejected) {
  capture_area area;
  area.has_x = area.has_w = true;
  area.w = 16;
  cap_error err;
  EXPECT_FALSE(svc_.capture_video(1, 1, area, &err));
  EXPECT_EQ(cap_err_kind::INVALID_ARGUMENT, err.kind);
  EXPECT_FALSE(svc_.has_capture());
}

TEST_F(CaptureServiceTest, ResultsNeedACapture) {
  cap_error err;
  std::vector<uint8_t> frame;
  EXPECT_FALSE(svc_.read_captured_frame(0, &frame, &err));
  EXPECT_EQ(cap_err_kind::INVALID_STATE, err.kind);
  int count = 0;
  EXPECT_FALSE(svc_.get_captured_frame_count(&count, &err));
  EXPECT_EQ(cap_err_kind::INVALID_STATE, err.kind);
  EXPECT_FALSE(svc_.stop_capturing_video(0, &err));
  EXPECT_EQ(cap_err_kind::INVALID_STATE, err.kind);
}

TEST_F(CaptureServiceTest, UnpluggedPortIsRejected) {
  cap_error err;
  ASSERT_TRUE(svc_.unplug(1, &err));
  EXPECT_FALSE(svc_.capture_video(1, 1, sized(kW, kH), &err));
  EXPECT_EQ(cap_err_kind::PORT_NOT_PLUGGED, err.kind);
}

TEST_F(CaptureServiceTest, CaptureVideoDetectsResolution) {
  set_field_count(3);
  cap_error err;
  ASSERT_TRUE(svc_.capture_video(1, 3, capture_area(), &err)) << err.msg;
  EXPECT_EQ(1, svc_.selected_input());
  EXPECT_EQ(1, svc_.captured_port());

  int count = 0;
  ASSERT_TRUE(svc_.get_captured_frame_count(&count, &err));
  EXPECT_EQ(3, count);
  uint32_t w = 0, h = 0;
  ASSERT_TRUE(svc_.get_captured_resolution(&w, &h, &err));
  EXPECT_EQ(kW, w);
  EXPECT_EQ(kH, h);

  std::vector<uint8_t> frame;
  ASSERT_TRUE(svc_.read_captured_frame(2, &frame, &err)) << err.msg;
  EXPECT_EQ((size_t)kW * kH * 3, frame.size());
  EXPECT_EQ('A', frame[0]);
  EXPECT_FALSE(svc_.read_captured_frame(3, &frame, &err));
  EXPECT_EQ(cap_err_kind::INVALID_ARGUMENT, err.kind);

  std::vector<field_hash> hashes;
  ASSERT_TRUE(svc_.get_captured_checksums(0, -1, &hashes, &err)) << err.msg;
  EXPECT_EQ(3u, hashes.size());
  ASSERT_TRUE(svc_.get_captured_checksums(1, 2, &hashes, &err));
  EXPECT_EQ(1u, hashes.size());
  EXPECT_FALSE(svc_.get_captured_checksums(3, -1, &hashes, &err));
  EXPECT_EQ(cap_err_kind::INVALID_ARGUMENT, err.kind);

  std::vector<std::vector<float>> hists;
  ASSERT_TRUE(svc_.get_captured_histograms(0, -1, &hists, &err)) << err.msg;
  ASSERT_EQ(3u, hists.size());
  EXPECT_FLOAT_EQ(0.0f, hists[0][0]);
}

TEST_F(CaptureServiceTest, TotalAboveLimitIsRejected) {
  cap_error err;
  uint32_t limit = 0;
  ASSERT_TRUE(svc_.get_max_frame_limit(1, kW, kH, &limit, &err));
  EXPECT_FALSE(svc_.capture_video(1, limit + 1, sized(kW, kH), &err));
  EXPECT_EQ(cap_err_kind::INVALID_ARGUMENT, err.kind);
}

TEST_F(CaptureServiceTest, MisalignedCropIsRejected) {
  capture_area area = sized(20, 8);
  area.has_x = area.has_y = true;
  area.x = 4;
  cap_error err;
  EXPECT_FALSE(svc_.capture_video(1, 1, area, &err));
  EXPECT_EQ(cap_err_kind::ALIGNMENT, err.kind);
}

TEST_F(CaptureServiceTest, ContinuousCaptureStopsAtIndex) {
  set_field_count(7);
  cap_error err;
  ASSERT_TRUE(svc_.start_capturing_video(1, sized(kW, kH), &err)) << err.msg;
  ASSERT_TRUE(svc_.stop_capturing_video(5, &err)) << err.msg;
  int count = 0;
  ASSERT_TRUE(svc_.get_captured_frame_count(&count, &err));
  EXPECT_EQ(7, count);
}

TEST_F(CaptureServiceTest, StopIndexBeyondLimitIsRejected) {
  set_field_count(1);
  cap_error err;
  ASSERT_TRUE(svc_.start_capturing_video(1, sized(kW, kH), &err)) << err.msg;
  EXPECT_FALSE(svc_.stop_capturing_video(100, &err));
  EXPECT_EQ(cap_err_kind::INVALID_ARGUMENT, err.kind);
  EXPECT_TRUE(svc_.stop_capturing_video(0, &err)) << err.msg;
}

TEST_F(CaptureServiceTest, ReachingFrameCapIsOverflow) {
  set_field_count(100);
  cap_error err;
  ASSERT_TRUE(svc_.start_capturing_video(1, sized(kW, kH), &err)) << err.msg;
  EXPECT_FALSE(svc_.stop_capturing_video(50, &err));
  EXPECT_EQ(cap_err_kind::OVERFLOW, err.kind);
}

TEST_F(CaptureServiceTest, CaptureOnAnotherPortJoinsThePreviousWorker) {
  // 140 MHz keeps HDMI in dual mode, so routing it needs no relock and it
  // shares dumper 0 with DP1.
  hdmi_rx_->pclk_mhz = 140.0;
  hpd_.plug(CONN_HDMI);
  mem_.set_dumper(1, kW / 2, kH, 0);
  cap_error err;
  ASSERT_TRUE(svc_.start_capturing_video(1, sized(kW, kH), &err)) << err.msg;
  EXPECT_TRUE(dp_->fields()->is_monitoring());

  ASSERT_TRUE(svc_.start_capturing_video(3, sized(kW, kH), &err)) << err.msg;
  EXPECT_FALSE(dp_->fields()->is_monitoring());
  EXPECT_TRUE(hdmi_->fields()->is_monitoring());
  EXPECT_EQ(3, svc_.captured_port());
  int dp_count = dp_->fields()->field_count();

  set_field_count(5);
  mem_.poke(fake_regs::kDumperBase[1] + fake_regs::FIELD_COUNT, 5);
  ASSERT_TRUE(wait_for_condition([this](bool *met, cap_error *) {
    *met = hdmi_->fields()->field_count() == 5;
    return true;
  }, 1, 2000, "HDMI field count", &err)) << err.msg;
  EXPECT_EQ(dp_count, dp_->fields()->field_count());

  ASSERT_TRUE(svc_.stop_capturing_video(0, &err)) << err.msg;
  int count = 0;
  ASSERT_TRUE(svc_.get_captured_frame_count(&count, &err));
  EXPECT_EQ(5, count);
}

TEST_F(CaptureServiceTest, SelectingAnotherPortDropsTheSession) {
  hdmi_rx_->pclk_mhz = 140.0;
  set_field_count(2);
  cap_error err;
  ASSERT_TRUE(svc_.capture_video(1, 2, sized(kW, kH), &err)) << err.msg;
  ASSERT_TRUE(svc_.select_input(3, &err)) << err.msg;
  int count = 0;
  EXPECT_FALSE(svc_.get_captured_frame_count(&count, &err));
  EXPECT_EQ(cap_err_kind::INVALID_STATE, err.kind);

  // Re-selecting the same port keeps a session.
  ASSERT_TRUE(svc_.capture_video(1, 2, sized(kW, kH), &err)) << err.msg;
  ASSERT_TRUE(svc_.select_input(1, &err)) << err.msg;
  EXPECT_TRUE(svc_.get_captured_frame_count(&count, &err)) << err.msg;
}

TEST_F(CaptureServiceTest, ComputePixelChecksumCapturesOneFrame) {
  set_field_count(1);
  mem_.set_hash_word(0, 0, 0x00010002);
  mem_.set_hash_word(0, 1, 0x00030004);
  cap_error err;
  field_hash h;
  ASSERT_TRUE(svc_.compute_pixel_checksum(1, capture_area(), &h, &err)) << err.msg;
  ASSERT_EQ(4u, h.size());
  EXPECT_EQ(0x0003, h[0]);
  EXPECT_EQ(0x0004, h[1]);
  EXPECT_EQ(0x0001, h[2]);
  EXPECT_EQ(0x0002, h[3]);
}

TEST_F(CaptureServiceTest, ThumbnailsAreClearedByNextCapture) {
  set_field_count(2);
  cap_error err;
  ASSERT_TRUE(svc_.capture_video(1, 2, sized(kW, kH), &err)) << err.msg;
  int id = -1;
  ASSERT_TRUE(svc_.cache_frame_thumbnail(1, 2, &id, &err)) << err.msg;
  EXPECT_EQ(0, id);
  ASSERT_TRUE(svc_.cache_frame_thumbnail(0, 4, &id, &err)) << err.msg;
  EXPECT_EQ(1, id);
  EXPECT_TRUE(file_exists(svc_.thumbnail_path(0)));
  EXPECT_TRUE(file_exists(svc_.thumbnail_path(1)));

  EXPECT_FALSE(svc_.cache_frame_thumbnail(0, 0, &id, &err));
  EXPECT_EQ(cap_err_kind::INVALID_ARGUMENT, err.kind);

  ASSERT_TRUE(svc_.capture_video(1, 2, sized(kW, kH), &err)) << err.msg;
  EXPECT_FALSE(file_exists(svc_.thumbnail_path(0)));
  EXPECT_FALSE(file_exists(svc_.thumbnail_path(1)));
}

TEST_F(CaptureServiceTest, AudioOnlyOnHdmi) {
  cap_error err;
  EXPECT_FALSE(svc_.start_capturing_audio(1, false, &err));
  EXPECT_EQ(cap_err_kind::UNSUPPORTED, err.kind);
  std::string path;
  audio_data_format fmt;
  EXPECT_FALSE(svc_.stop_capturing_audio(3, &path, &fmt, &err));
  EXPECT_EQ(cap_err_kind::INVALID_STATE, err.kind);
}

TEST_F(CaptureServiceTest, HdmiAudioToMemory) {
  cap_error err;
  ASSERT_TRUE(svc_.start_capturing_audio(3, false, &err)) << err.msg;
  EXPECT_EQ(1, hdmi_rx_->audio_resets);
  mem_.poke(fake_regs::AUDIO_PAGE_COUNT, 5);
  std::string path = "unset";
  audio_data_format fmt;
  ASSERT_TRUE(svc_.stop_capturing_audio(3, &path, &fmt, &err)) << err.msg;
  EXPECT_TRUE(path.empty());
  EXPECT_EQ(48000, fmt.rate);
}

TEST_F(CaptureServiceTest, HdmiAudioToFileUsesDumpDir) {
  cap_error err;
  ASSERT_TRUE(svc_.start_capturing_audio(3, true, &err)) << err.msg;
  const std::string path = audio_mgr_.file_path();
  EXPECT_EQ(0u, path.find(dir_ + "/audio_"));
  EXPECT_EQ(path.size() - 4, path.rfind(".raw"));
  mem_.poke(fake_regs::AUDIO_PAGE_COUNT, 3);
  ASSERT_TRUE(wait_for_condition([&path](bool *met, cap_error *) {
    struct stat st;
    *met = stat(path.c_str(), &st) == 0 && st.st_size == 3 * (off_t)audio_dumper::kPageSize;
    return true;
  }, 2, 2000, "audio file", &err)) << err.msg;

  std::string out;
  audio_data_format fmt;
  ASSERT_TRUE(svc_.stop_capturing_audio(3, &out, &fmt, &err)) << err.msg;
  EXPECT_EQ(path, out);
  struct stat st;
  ASSERT_EQ(0, stat(out.c_str(), &st));
  EXPECT_EQ((off_t)audio_dumper::kPageSize, st.st_size);
}

}  // namespace
