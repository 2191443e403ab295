#include <gtest/gtest.h>

#include <sys/stat.h>
#include <unistd.h>
#include <cstdlib>
#include <string>

#include "audio_capture.h"
#include "fake_hw.h"
#include "wait_util.h"

namespace {

class AudioCaptureTest : public ::testing::Test {
protected:
  AudioCaptureTest() : adump_(&mem_), mgr_(&adump_, &tool_, 2) {}

  void SetUp() override {
    char tmpl[] = "/tmp/audio_capture_test_XXXXXX";
    int fd = mkstemp(tmpl);
    ASSERT_GE(fd, 0);
    close(fd);
    path_ = tmpl;
  }
  void TearDown() override { unlink(path_.c_str()); }

  long long file_size() {
    struct stat st;
    if (stat(path_.c_str(), &st) != 0) return -1;
    return (long long)st.st_size;
  }

  fake_fpga_mem mem_;
  fake_pixel_dump tool_;
  audio_dumper adump_;
  audio_capture_manager mgr_;
  std::string path_;
};

TEST_F(AudioCaptureTest, StopBeforeStartIsInvalid) {
  cap_error err;
  audio_data_format fmt;
  EXPECT_FALSE(mgr_.stop(&fmt, &err));
  EXPECT_EQ(cap_err_kind::INVALID_STATE, err.kind);
}

TEST_F(AudioCaptureTest, StartProgramsRing) {
  cap_error err;
  ASSERT_TRUE(mgr_.start("", &err)) << err.msg;
  EXPECT_TRUE(mgr_.is_capturing());
  EXPECT_EQ(audio_dumper::kDefaultStart, mem_.peek(fake_regs::AUDIO_CTRL + 0x8));
  EXPECT_EQ(audio_dumper::kDefaultEnd, mem_.peek(fake_regs::AUDIO_CTRL + 0xc));
  EXPECT_EQ(0x2000u, adump_.max_pages());
}

TEST_F(AudioCaptureTest, EmptyCaptureIsError) {
  cap_error err;
  ASSERT_TRUE(mgr_.start("", &err));
  audio_data_format fmt;
  EXPECT_FALSE(mgr_.stop(&fmt, &err));
  EXPECT_EQ(cap_err_kind::INVALID_STATE, err.kind);
  EXPECT_FALSE(mgr_.is_capturing());
}

TEST_F(AudioCaptureTest, MemoryOnlyCaptureReturnsFormat) {
  cap_error err;
  ASSERT_TRUE(mgr_.start("", &err));
  mem_.poke(fake_regs::AUDIO_PAGE_COUNT, 3);
  audio_data_format fmt;
  fmt.channel = 0;
  ASSERT_TRUE(mgr_.stop(&fmt, &err)) << err.msg;
  EXPECT_EQ("raw", fmt.file_type);
  EXPECT_EQ("S32_LE", fmt.sample_format);
  EXPECT_EQ(8, fmt.channel);
  EXPECT_EQ(48000, fmt.rate);
  EXPECT_TRUE(tool_.page_calls.empty());
}

TEST_F(AudioCaptureTest, FailedFileStartStopsTheHardware) {
  cap_error err;
  EXPECT_FALSE(mgr_.start("/nonexistent_dir_for_audio_capture/audio.raw", &err));
  EXPECT_EQ(cap_err_kind::TOOL_FAILURE, err.kind);
  EXPECT_FALSE(mgr_.is_capturing());
  audio_data_format fmt;
  EXPECT_FALSE(mgr_.stop(&fmt, &err));
  EXPECT_EQ(cap_err_kind::INVALID_STATE, err.kind);
}

TEST_F(AudioCaptureTest, FileLosesFinalTwoPages) {
  cap_error err;
  ASSERT_TRUE(mgr_.start(path_, &err)) << err.msg;
  mem_.poke(fake_regs::AUDIO_PAGE_COUNT, 4);
  const long long full = 4LL * audio_dumper::kPageSize;
  ASSERT_TRUE(wait_for_condition([this, full](bool *met, cap_error *) {
    *met = file_size() == full;
    return true;
  }, 2, 2000, "audio file", &err)) << err.msg;

  audio_data_format fmt;
  ASSERT_TRUE(mgr_.stop(&fmt, &err)) << err.msg;
  EXPECT_EQ(2LL * audio_dumper::kPageSize, file_size());
}

TEST_F(AudioCaptureTest, ShortFileIsError) {
  cap_error err;
  ASSERT_TRUE(mgr_.start(path_, &err));
  mem_.poke(fake_regs::AUDIO_PAGE_COUNT, 1);
  const long long one = audio_dumper::kPageSize;
  ASSERT_TRUE(wait_for_condition([this, one](bool *met, cap_error *) {
    *met = file_size() == one;
    return true;
  }, 2, 2000, "audio file", &err)) << err.msg;

  audio_data_format fmt;
  EXPECT_FALSE(mgr_.stop(&fmt, &err));
  EXPECT_EQ(cap_err_kind::INVALID_STATE, err.kind);
}

}  // namespace
