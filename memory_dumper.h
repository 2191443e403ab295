#pragma once
#include <stdint.h>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "audio_dumper.h"
#include "capture_error.h"
#include "pixel_tools.h"

// Drains a hardware page ring into a file once per period.
//
//   period            0   1   2   3
//   written by FPGA   A   B   C   D
//   read by dumper        A   B   C
//
// Pages written in one period are read in the next, so A+B must fit in the
// ring. current - two_periods_old is checked before anything is read, which
// reports the overflow one period before the data would be overwritten.
class memory_dumper {
public:
  static const uint32_t kDefaultPeriodMs = 1000;

  memory_dumper(const std::string &file_path, page_ring *ring, pixel_dump_tool *tool,
                uint32_t period_ms = kDefaultPeriodMs);
  ~memory_dumper();

  memory_dumper(const memory_dumper&) = delete;
  memory_dumper& operator=(const memory_dumper&) = delete;

  // Creates (or empties) the output file, then starts the worker.
  bool start(cap_error *err);
  // Requests the worker to finish and joins it. Returns the worker's error, if any.
  bool stop(cap_error *err);
  bool is_running() const { return worker_.joinable(); }

  // One period of work. Called by the worker; public for tests.
  bool handle_one_period(cap_error *err);

  uint64_t bytes_written() const { return bytes_written_; }
  const std::string &file_path() const { return path_; }

private:
  void run();
  bool dump_range(uint32_t start_index, uint32_t count, cap_error *err);
  void drop_partial_period(uint64_t bytes_before);

  std::string path_;
  page_ring *ring_;
  pixel_dump_tool *tool_;
  uint32_t period_ms_;

  int64_t last_ = 0;
  int64_t last_last_ = -1;   // -1: fewer than two periods seen
  uint64_t bytes_written_ = 0;

  std::thread worker_;
  std::mutex mtx_;
  std::condition_variable cv_;
  bool stop_requested_ = false;
  bool failed_ = false;
  cap_error worker_err_;
};
