#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "fake_hw.h"
#include "field_manager.h"

namespace {

dump_window full(uint32_t w, uint32_t h) {
  dump_window win;
  win.full_screen = true;
  win.w = w;
  win.h = h;
  return win;
}

dump_window crop(uint32_t x, uint32_t y, uint32_t w, uint32_t h) {
  dump_window win;
  win.full_screen = false;
  win.x = x;
  win.y = y;
  win.w = w;
  win.h = h;
  return win;
}

class FieldManagerTest : public ::testing::Test {
protected:
  FieldManagerTest() : a_(&mem_, 0), b_(&mem_, 1) { opt_.probe_delay_ms = 1; }

  std::unique_ptr<field_manager> make(connector_id id, bool dual) {
    std::unique_ptr<field_manager> fm(new field_manager(id, &a_, &b_, &pixdump_, &hist_, opt_));
    fm->select_path(dual);
    return fm;
  }

  static bool wait_fields(field_manager *fm, int n) {
    for (int i = 0; i < 400; i++) {
      if (fm->field_count() >= n) return true;
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
  }

  fake_fpga_mem mem_;
  video_dumper a_, b_;
  fake_pixel_dump pixdump_;
  fake_histogram hist_;
  field_manager_options opt_;
};

TEST_F(FieldManagerTest, FullHdLimitFiveScenario) {
  auto fm = make(CONN_DP1, false);
  mem_.set_dumper(0, 1920, 1080, 5);
  cap_error err;
  ASSERT_TRUE(fm->dump_fields_to_limit(5, full(1920, 1080), 5000, &err)) << err.msg;
  EXPECT_EQ(5, fm->field_count());

  std::vector<field_hash> hashes;
  ASSERT_TRUE(fm->field_hashes(0, 5, &hashes, &err)) << err.msg;
  ASSERT_EQ(5u, hashes.size());
  for (const auto &h : hashes) EXPECT_EQ(4u, h.size());
}

TEST_F(FieldManagerTest, ReadSizeMatchesCropWindow) {
  auto fm = make(CONN_DP1, false);
  const dump_window wins[] = {crop(8, 4, 64, 32), crop(0, 0, 8, 1), crop(128, 7, 40, 3), full(24, 6)};
  for (const auto &win : wins) {
    mem_.set_dumper(0, win.w, win.h, 3);
    cap_error err;
    ASSERT_TRUE(fm->dump_fields_to_limit(3, win, 1000, &err)) << err.msg;
    for (int i = 0; i < 3; i++) {
      std::vector<uint8_t> data;
      ASSERT_TRUE(fm->read_dumped_field(i, &data, &err)) << err.msg;
      EXPECT_EQ((size_t)win.w * win.h * 3, data.size());
    }
  }
}

TEST_F(FieldManagerTest, DualModeInterleavesColumns) {
  auto fm = make(CONN_DP1, true);
  mem_.set_dumper(0, 16, 4, 2);
  mem_.set_dumper(1, 16, 4, 2);
  cap_error err;
  ASSERT_TRUE(fm->dump_fields_to_limit(2, full(32, 4), 1000, &err)) << err.msg;

  std::vector<uint8_t> data;
  ASSERT_TRUE(fm->read_dumped_field(1, &data, &err)) << err.msg;
  ASSERT_EQ(32u * 4u * 3u, data.size());
  for (uint32_t y = 0; y < 4; y++) {
    for (uint32_t x = 0; x < 32; x++) {
      const uint8_t *p = &data[(y * 32 + x) * 3];
      EXPECT_EQ(x % 2 ? 'B' : 'A', p[0]) << "x=" << x;
      EXPECT_EQ(x / 2, p[1]);
      EXPECT_EQ(y, p[2]);
    }
  }
}

TEST_F(FieldManagerTest, Dp2DualTakesEvenPixelsFromDumperB) {
  auto fm = make(CONN_DP2, true);
  mem_.set_dumper(0, 8, 2, 1);
  mem_.set_dumper(1, 8, 2, 1);
  cap_error err;
  ASSERT_TRUE(fm->dump_fields_to_limit(1, full(16, 2), 1000, &err)) << err.msg;
  std::vector<uint8_t> data;
  ASSERT_TRUE(fm->read_dumped_field(0, &data, &err)) << err.msg;
  EXPECT_EQ('B', data[0]);
  EXPECT_EQ('A', data[3]);
}

TEST_F(FieldManagerTest, DualHashCombinesBothPaths) {
  auto fm = make(CONN_DP1, true);
  mem_.set_dumper(0, 16, 4, 1);
  mem_.set_dumper(1, 16, 4, 1);
  mem_.set_hash_word(0, 0, 0x11112222);
  mem_.set_hash_word(1, 0, 0x33334444);
  cap_error err;
  ASSERT_TRUE(fm->dump_fields_to_limit(1, full(32, 4), 1000, &err)) << err.msg;
  std::vector<field_hash> hashes;
  ASSERT_TRUE(fm->field_hashes(0, 1, &hashes, &err));
  EXPECT_EQ(field_hash({0x3333, 0x1111, 0x4444, 0x2222}), hashes[0]);
}

TEST_F(FieldManagerTest, DualHistogramAveragesPaths) {
  auto fm = make(CONN_HDMI, true);
  mem_.set_dumper(0, 16, 4, 2);
  mem_.set_dumper(1, 16, 4, 2);
  cap_error err;
  ASSERT_TRUE(fm->dump_fields_to_limit(2, full(32, 4), 1000, &err)) << err.msg;
  std::vector<std::vector<float>> hists;
  ASSERT_TRUE(fm->histograms(0, 2, &hists, &err)) << err.msg;
  ASSERT_EQ(2u, hists.size());
  ASSERT_EQ(kHistogramSize, hists[0].size());
  EXPECT_FLOAT_EQ(0.5f, hists[1][0]);
}

TEST_F(FieldManagerTest, CropAlignmentDependsOnPixelMode) {
  cap_error err;
  EXPECT_TRUE(dump_window_check(crop(8, 3, 64, 5), false, &err));
  EXPECT_FALSE(dump_window_check(crop(8, 0, 64, 4), true, &err));
  EXPECT_EQ(cap_err_kind::ALIGNMENT, err.kind);
  EXPECT_FALSE(dump_window_check(crop(4, 0, 64, 4), false, &err));
  EXPECT_EQ(cap_err_kind::ALIGNMENT, err.kind);
  EXPECT_FALSE(dump_window_check(crop(0, 0, 60, 4), false, &err));
  EXPECT_EQ(cap_err_kind::ALIGNMENT, err.kind);
  EXPECT_TRUE(dump_window_check(full(1366, 768), true, &err));
}

TEST_F(FieldManagerTest, MisalignedCropNeverTouchesHardware) {
  auto fm = make(CONN_DP1, true);
  size_t writes = mem_.writes().size();
  cap_error err;
  EXPECT_FALSE(fm->dump_fields_to_limit(1, crop(8, 0, 32, 4), 1000, &err));
  EXPECT_EQ(cap_err_kind::ALIGNMENT, err.kind);
  EXPECT_EQ(writes, mem_.writes().size());
}

TEST_F(FieldManagerTest, LimitAboveMaxIsRejected) {
  auto fm = make(CONN_DP1, false);
  uint32_t max = fm->max_field_limit(1920, 1080);
  cap_error err;
  EXPECT_FALSE(fm->dump_fields_to_limit(max + 1, full(1920, 1080), 1000, &err));
  EXPECT_EQ(cap_err_kind::INVALID_ARGUMENT, err.kind);
  EXPECT_FALSE(fm->dump_fields_to_limit(0, full(1920, 1080), 1000, &err));
}

TEST_F(FieldManagerTest, DualModeLimitUsesHalfWidth) {
  auto single = make(CONN_DP1, false);
  auto dual = make(CONN_DP1, true);
  EXPECT_EQ(video_dumper::max_field_limit(1920, 1080), single->max_field_limit(1920, 1080));
  EXPECT_EQ(video_dumper::max_field_limit(960, 1080), dual->max_field_limit(1920, 1080));
}

TEST_F(FieldManagerTest, StopWithoutSessionIsInvalidState) {
  auto fm = make(CONN_DP1, false);
  cap_error err;
  EXPECT_FALSE(fm->stop_dumping_fields(&err));
  EXPECT_EQ(cap_err_kind::INVALID_STATE, err.kind);
}

TEST_F(FieldManagerTest, TimeoutCarriesRegisterDump) {
  auto fm = make(CONN_DP1, false);
  mem_.set_dumper(0, 64, 4, 0);
  cap_error err;
  EXPECT_FALSE(fm->dump_fields_to_limit(2, full(64, 4), 30, &err));
  EXPECT_EQ(cap_err_kind::TIMEOUT, err.kind);
  EXPECT_EQ(8u * 4u, err.reg_dump.size());
}

TEST_F(FieldManagerTest, HashOverrunIsOverflow) {
  auto fm = make(CONN_DP1, true);
  mem_.set_dumper(0, 16, 4, 300);
  mem_.set_dumper(1, 16, 4, 300);
  cap_error err;
  EXPECT_FALSE(fm->dump_fields_to_limit(300, full(32, 4), 1000, &err));
  EXPECT_EQ(cap_err_kind::OVERFLOW, err.kind);
}

TEST_F(FieldManagerTest, DualPathDisagreementFollowsStrictness) {
  mem_.set_dumper(0, 960, 1080, 0);
  mem_.set_dumper(1, 952, 1080, 0);
  uint32_t w = 0, h = 0;
  cap_error err;
  auto lenient = make(CONN_DP1, true);
  ASSERT_TRUE(lenient->compute_resolution(&w, &h, &err));
  EXPECT_EQ(1912u, w);
  EXPECT_EQ(1080u, h);

  opt_.strict_dual_paths = true;
  auto strict = make(CONN_DP1, true);
  EXPECT_FALSE(strict->compute_resolution(&w, &h, &err));
  EXPECT_EQ(cap_err_kind::FSM_FAILURE, err.kind);
}

TEST_F(FieldManagerTest, ContinuousCaptureKeepsLatestFields) {
  auto fm = make(CONN_DP1, false);
  mem_.set_dumper(0, 64, 4, 5);
  cap_error err;
  ASSERT_TRUE(fm->start_dumping_fields(2, full(64, 4), 10, &err)) << err.msg;
  ASSERT_TRUE(wait_fields(fm.get(), 5));
  EXPECT_TRUE(fm->is_monitoring());

  std::vector<uint8_t> data;
  EXPECT_FALSE(fm->read_dumped_field(2, &data, &err));
  EXPECT_EQ(cap_err_kind::INVALID_ARGUMENT, err.kind);
  EXPECT_FALSE(fm->read_dumped_field(5, &data, &err));
  ASSERT_TRUE(fm->read_dumped_field(3, &data, &err)) << err.msg;
  // Field 3 lives in ring slot 1.
  EXPECT_EQ(fake_regs::kCaptureAddr[0] + video_dumper::aligned_field_size(64, 4), pixdump_.pixel_calls.back());
  ASSERT_TRUE(fm->read_dumped_field(4, &data, &err)) << err.msg;

  ASSERT_TRUE(fm->stop_dumping_fields(&err)) << err.msg;
  EXPECT_FALSE(fm->is_monitoring());
  EXPECT_EQ(5, fm->field_count());
}

TEST_F(FieldManagerTest, MonitorErrorIsReportedOnStop) {
  auto fm = make(CONN_DP1, false);
  mem_.set_dumper(0, 64, 4, 3);
  hist_.fail = true;
  cap_error err;
  ASSERT_TRUE(fm->start_dumping_fields(4, full(64, 4), 10, &err)) << err.msg;
  // The first poll fails in the histogram tool and ends the worker.
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_FALSE(fm->stop_dumping_fields(&err));
  EXPECT_EQ(cap_err_kind::TOOL_FAILURE, err.kind);
}

TEST_F(FieldManagerTest, RangeChecksOnHashes) {
  auto fm = make(CONN_DP1, false);
  mem_.set_dumper(0, 64, 4, 3);
  cap_error err;
  ASSERT_TRUE(fm->dump_fields_to_limit(3, full(64, 4), 1000, &err));
  std::vector<field_hash> hashes;
  EXPECT_FALSE(fm->field_hashes(0, 4, &hashes, &err));
  EXPECT_FALSE(fm->field_hashes(-1, 2, &hashes, &err));
  EXPECT_FALSE(fm->field_hashes(2, 1, &hashes, &err));
  EXPECT_TRUE(fm->field_hashes(1, 3, &hashes, &err));
  EXPECT_EQ(2u, hashes.size());
}

}  // namespace
