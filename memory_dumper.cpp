#include "memory_dumper.h"

#include <errno.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <chrono>
#include <vector>

memory_dumper::memory_dumper(const std::string &file_path, page_ring *ring, pixel_dump_tool *tool,
                             uint32_t period_ms)
    : path_(file_path), ring_(ring), tool_(tool), period_ms_(period_ms) {}

memory_dumper::~memory_dumper() {
  if (worker_.joinable()) {
    cap_error err;
    if (!stop(&err))
      fprintf(stderr, "[audio] memory dumper ended with error: %s\n", err.msg.c_str());
  }
}

bool memory_dumper::start(cap_error *err) {
  if (worker_.joinable())
    return cap_fail(err, cap_err_kind::INVALID_STATE, "memory dumper already running");
  FILE *f = fopen(path_.c_str(), "wb");
  if (!f) return cap_fail(err, cap_err_kind::TOOL_FAILURE, "create %s failed: %s", path_.c_str(), strerror(errno));
  if (fclose(f) != 0) return cap_fail(err, cap_err_kind::TOOL_FAILURE, "create %s failed", path_.c_str());
  last_ = 0;
  last_last_ = -1;
  bytes_written_ = 0;
  stop_requested_ = false;
  failed_ = false;
  worker_err_ = cap_error();
  fprintf(stderr, "[audio] dumping ring to %s every %u ms\n", path_.c_str(), period_ms_);
  worker_ = std::thread([this]() { run(); });
  return true;
}

void memory_dumper::run() {
  for (;;) {
    {
      std::unique_lock<std::mutex> lk(mtx_);
      cv_.wait_for(lk, std::chrono::milliseconds(period_ms_), [this]() { return stop_requested_; });
      if (stop_requested_) return;
    }
    cap_error e;
    if (!handle_one_period(&e)) {
      std::lock_guard<std::mutex> lk(mtx_);
      failed_ = true;
      worker_err_ = e;
      return;
    }
  }
}

bool memory_dumper::stop(cap_error *err) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
  std::lock_guard<std::mutex> lk(mtx_);
  if (failed_) {
    if (err) *err = worker_err_;
    return false;
  }
  return true;
}

bool memory_dumper::handle_one_period(cap_error *err) {
  int64_t current = ring_->current_page_count();
  int64_t delta = current - last_;
  int64_t max_pages = ring_->max_pages();
  fprintf(stderr, "[audio] page count 0x%llx, last 0x%llx, this period 0x%llx\n",
          (long long)current, (long long)last_, (long long)delta);

  if (delta == 0) return true;
  if (delta < 0)
    return cap_fail(err, cap_err_kind::INVALID_STATE, "page count in this period: %lld is invalid",
                    (long long)delta);

  if (last_last_ >= 0) {
    int64_t buffered = current - last_last_;
    if (buffered > max_pages)
      return cap_fail(err, cap_err_kind::OVERFLOW, "buffered pages 0x%llx more than page limit 0x%llx",
                      (long long)buffered, (long long)max_pages);
  }
  if (delta > max_pages)
    return cap_fail(err, cap_err_kind::OVERFLOW, "pages in this period 0x%llx more than page limit 0x%llx",
                    (long long)delta, (long long)max_pages);

  uint32_t start_index = (uint32_t)(last_ % max_pages);
  uint32_t head = (uint32_t)std::min<int64_t>(delta, max_pages - start_index);
  uint32_t tail = (uint32_t)(delta - head);
  uint64_t before = bytes_written_;
  if (!dump_range(start_index, head, err) || (tail && !dump_range(0, tail, err))) {
    drop_partial_period(before);
    return false;
  }

  last_last_ = last_;
  last_ = current;
  return true;
}

// The file only ever holds whole periods.
void memory_dumper::drop_partial_period(uint64_t bytes_before) {
  uint64_t appended = bytes_written_ - bytes_before;
  if (!appended) return;
  struct stat st;
  if (stat(path_.c_str(), &st) != 0 || ::truncate(path_.c_str(), st.st_size - (off_t)appended) != 0) {
    fprintf(stderr, "[audio] could not cut partial period from %s: %s\n", path_.c_str(), strerror(errno));
    return;
  }
  bytes_written_ = bytes_before;
}

bool memory_dumper::dump_range(uint32_t start_index, uint32_t count, cap_error *err) {
  if (start_index + count > ring_->max_pages())
    return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "page range [%u, %u) beyond ring of %u pages",
                    start_index, start_index + count, ring_->max_pages());
  uint32_t addr = ring_->start_address() + start_index * ring_->page_size();
  std::vector<uint8_t> data;
  if (!tool_->dump_pages(addr, ring_->page_size(), count, &data, err)) return false;

  FILE *f = fopen(path_.c_str(), "ab");
  if (!f) return cap_fail(err, cap_err_kind::TOOL_FAILURE, "open %s failed", path_.c_str());
  size_t n = fwrite(data.data(), 1, data.size(), f);
  bool ok = (n == data.size());
  if (fclose(f) != 0) ok = false;
  if (!ok) return cap_fail(err, cap_err_kind::TOOL_FAILURE, "write %s failed", path_.c_str());
  bytes_written_ += data.size();
  return true;
}
