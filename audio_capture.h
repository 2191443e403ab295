#pragma once
#include <memory>
#include <string>

#include "audio_dumper.h"
#include "capture_error.h"
#include "memory_dumper.h"
#include "pixel_tools.h"

// Audio capture session: FPGA dumping to memory plus, when a file is
// requested, a memory_dumper draining the ring into it.
class audio_capture_manager {
public:
  audio_capture_manager(audio_dumper *adump, pixel_dump_tool *tool, uint32_t period_ms = memory_dumper::kDefaultPeriodMs)
      : adump_(adump), tool_(tool), period_ms_(period_ms) {}

  bool is_capturing() { return adump_->is_dumping(); }

  // Empty file_path captures to memory only.
  bool start(const std::string &file_path, cap_error *err);
  // Drops the final two pages of the file; the hardware leaves them incomplete.
  bool stop(audio_data_format *fmt, cap_error *err);

  const std::string &file_path() const { return file_path_; }

private:
  bool truncate_file(uint32_t pages, cap_error *err);

  audio_dumper *adump_;
  pixel_dump_tool *tool_;
  uint32_t period_ms_;
  std::string file_path_;
  std::unique_ptr<memory_dumper> mem_dumper_;
};
