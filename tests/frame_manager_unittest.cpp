#include <gtest/gtest.h>

#include "fake_hw.h"
#include "frame_manager.h"

namespace {

dump_window full(uint32_t w, uint32_t h) {
  dump_window win;
  win.w = w;
  win.h = h;
  return win;
}

class FrameManagerTest : public ::testing::Test {
protected:
  FrameManagerTest()
    : a_(&mem_, 0), b_(&mem_, 1),
      fields_(CONN_HDMI, &a_, &b_, &pixdump_, &hist_, options()),
      frames_(&fields_, [this](bool *i, cap_error *) { *i = interlaced_; return true; }) {
    fields_.select_path(false);
  }

  static field_manager_options options() {
    field_manager_options opt;
    opt.probe_delay_ms = 1;
    return opt;
  }

  fake_fpga_mem mem_;
  video_dumper a_, b_;
  fake_pixel_dump pixdump_;
  fake_histogram hist_;
  field_manager fields_;
  frame_manager frames_;
  bool interlaced_ = false;
};

TEST_F(FrameManagerTest, ProgressiveFrameIsField) {
  mem_.set_dumper(1, 64, 8, 3);
  cap_error err;
  ASSERT_TRUE(frames_.dump_frames_to_limit(3, full(64, 8), 1000, &err)) << err.msg;
  EXPECT_EQ(3, frames_.dumped_frame_count());
  for (int i = 0; i < 3; i++) {
    std::vector<uint8_t> frame, field;
    ASSERT_TRUE(frames_.read_dumped_frame(i, &frame, &err)) << err.msg;
    ASSERT_TRUE(fields_.read_dumped_field(i, &field, &err)) << err.msg;
    EXPECT_EQ(field, frame);
  }
  std::vector<field_hash> fh, hh;
  ASSERT_TRUE(frames_.frame_hashes(0, 3, &fh, &err));
  ASSERT_TRUE(fields_.field_hashes(0, 3, &hh, &err));
  EXPECT_EQ(hh, fh);
}

TEST_F(FrameManagerTest, InterlacedResolutionDoublesHeight) {
  interlaced_ = true;
  mem_.set_dumper(1, 1920, 540, 0);
  uint32_t w = 0, h = 0;
  cap_error err;
  ASSERT_TRUE(frames_.compute_resolution(&w, &h, &err));
  EXPECT_EQ(1920u, w);
  EXPECT_EQ(1080u, h);
}

TEST_F(FrameManagerTest, InterlacedMaxLimitCountsFieldPairs) {
  interlaced_ = true;
  uint32_t limit = 0;
  cap_error err;
  ASSERT_TRUE(frames_.max_frame_limit(1920, 1080, &limit, &err));
  EXPECT_EQ(fields_.max_field_limit(1920, 540) / 2, limit);

  interlaced_ = false;
  ASSERT_TRUE(frames_.max_frame_limit(1920, 1080, &limit, &err));
  EXPECT_EQ(fields_.max_field_limit(1920, 1080), limit);
}

TEST_F(FrameManagerTest, InterlacedFrameInterleavesTwoFields) {
  interlaced_ = true;
  mem_.set_dumper(1, 16, 4, 4);
  cap_error err;
  ASSERT_TRUE(frames_.dump_frames_to_limit(2, full(16, 8), 1000, &err)) << err.msg;
  EXPECT_EQ(2, frames_.dumped_frame_count());
  uint32_t w = 0, h = 0;
  frames_.captured_resolution(&w, &h);
  EXPECT_EQ(16u, w);
  EXPECT_EQ(8u, h);

  std::vector<uint8_t> frame;
  ASSERT_TRUE(frames_.read_dumped_frame(1, &frame, &err)) << err.msg;
  ASSERT_EQ(16u * 8u * 3u, frame.size());
  for (uint32_t line = 0; line < 8; line++) EXPECT_EQ(line / 2, frame[line * 16 * 3 + 2]);

  // Frame 1 is fields 2 and 3.
  ASSERT_GE(pixdump_.pixel_calls.size(), 2u);
  uint32_t field_size = video_dumper::aligned_field_size(16, 4);
  size_t n = pixdump_.pixel_calls.size();
  EXPECT_EQ(fake_regs::kCaptureAddr[1] + 2 * field_size, pixdump_.pixel_calls[n - 2]);
  EXPECT_EQ(fake_regs::kCaptureAddr[1] + 3 * field_size, pixdump_.pixel_calls[n - 1]);
}

TEST_F(FrameManagerTest, InterlacedRejectsOddHeight) {
  interlaced_ = true;
  cap_error err;
  EXPECT_FALSE(frames_.dump_frames_to_limit(1, full(16, 7), 1000, &err));
  EXPECT_EQ(cap_err_kind::INVALID_ARGUMENT, err.kind);
}

TEST_F(FrameManagerTest, RejectedStartKeepsPreviousSession) {
  mem_.set_dumper(1, 64, 8, 3);
  cap_error err;
  ASSERT_TRUE(frames_.dump_frames_to_limit(3, full(64, 8), 1000, &err)) << err.msg;

  interlaced_ = true;
  EXPECT_FALSE(frames_.start_dumping_frames(1, full(16, 7), 10, &err));
  EXPECT_EQ(cap_err_kind::INVALID_ARGUMENT, err.kind);
  EXPECT_FALSE(frames_.session_interlaced());
  EXPECT_EQ(3, frames_.dumped_frame_count());
  uint32_t w = 0, h = 0;
  frames_.captured_resolution(&w, &h);
  EXPECT_EQ(8u, h);
}

TEST_F(FrameManagerTest, InterlacedHashesAndHistogramsUnsupported) {
  interlaced_ = true;
  mem_.set_dumper(1, 16, 4, 2);
  cap_error err;
  ASSERT_TRUE(frames_.dump_frames_to_limit(1, full(16, 8), 1000, &err)) << err.msg;
  EXPECT_TRUE(frames_.session_interlaced());
  std::vector<field_hash> hashes;
  EXPECT_FALSE(frames_.frame_hashes(0, 1, &hashes, &err));
  EXPECT_EQ(cap_err_kind::UNSUPPORTED, err.kind);
  std::vector<std::vector<float>> hists;
  EXPECT_FALSE(frames_.histograms(0, 1, &hists, &err));
  EXPECT_EQ(cap_err_kind::UNSUPPORTED, err.kind);
}

}  // namespace
