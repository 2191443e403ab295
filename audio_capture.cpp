#include "audio_capture.h"

#include <sys/stat.h>
#include <unistd.h>
#include <cstdio>

bool audio_capture_manager::start(const std::string &file_path, cap_error *err) {
  if (mem_dumper_) {
    cap_error stale;
    if (!mem_dumper_->stop(&stale))
      fprintf(stderr, "[audio] previous memory dumper failed: %s\n", stale.msg.c_str());
    mem_dumper_.reset();
  }
  file_path_ = file_path;
  if (!adump_->start_dumping_to_memory(err)) return false;
  if (!file_path.empty()) {
    mem_dumper_.reset(new memory_dumper(file_path, adump_, tool_, period_ms_));
    if (!mem_dumper_->start(err)) {
      adump_->stop_dumping_to_memory(nullptr, nullptr);
      mem_dumper_.reset();
      return false;
    }
  }
  fprintf(stderr, "[audio] started capturing audio\n");
  return true;
}

bool audio_capture_manager::stop(audio_data_format *fmt, cap_error *err) {
  if (!is_capturing())
    return cap_fail(err, cap_err_kind::INVALID_STATE, "Stop capturing audio before start");

  cap_error dump_err;
  bool dump_ok = true;
  if (mem_dumper_) dump_ok = mem_dumper_->stop(&dump_err);
  uint32_t mapped_start = 0, page_count = 0;
  adump_->stop_dumping_to_memory(&mapped_start, &page_count);
  fprintf(stderr, "[audio] stopped capturing audio (%u pages)\n", page_count);
  mem_dumper_.reset();

  if (!dump_ok) {
    if (err) *err = dump_err;
    return false;
  }
  if (page_count == 0)
    return cap_fail(err, cap_err_kind::INVALID_STATE,
                    "No audio data was captured. Perhaps this input is not plugged ?");
  if (!file_path_.empty() && !truncate_file(2, err)) return false;
  if (fmt) *fmt = audio_dumper::data_format();
  return true;
}

bool audio_capture_manager::truncate_file(uint32_t pages, cap_error *err) {
  struct stat st;
  if (stat(file_path_.c_str(), &st) != 0)
    return cap_fail(err, cap_err_kind::INVALID_STATE, "Not enough audio data was captured.");
  long long new_size = (long long)st.st_size - (long long)adump_->page_size() * pages;
  if (new_size <= 0)
    return cap_fail(err, cap_err_kind::INVALID_STATE, "Not enough audio data was captured.");
  if (truncate(file_path_.c_str(), (off_t)new_size) != 0)
    return cap_fail(err, cap_err_kind::TOOL_FAILURE, "truncate %s failed", file_path_.c_str());
  return true;
}
