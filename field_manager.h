#pragma once
#include <stdint.h>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

#include "capture_error.h"
#include "connector_ids.h"
#include "pixel_tools.h"
#include "video_dumper.h"

// Crop rectangle of a capture. full_screen leaves cropping off; w/h still
// give the field size in that case.
struct dump_window {
  bool full_screen = true;
  uint32_t x = 0, y = 0, w = 0, h = 0;
};

// x and width must be multiples of 16 pixels in dual-pixel mode, 8 otherwise.
bool dump_window_check(const dump_window &win, bool dual, cap_error *err);

typedef std::vector<uint16_t> field_hash;   // 4 hash16 values

struct field_manager_options {
  // Dual-pixel paths disagreeing (resolution, field count) is an error
  // instead of a warning.
  bool strict_dual_paths = false;
  uint32_t probe_delay_ms = 8;              // ~1/120 s
};

// Drives one or two video dumpers as one capture path and keeps the per-field
// hashes and histograms of the current capture session.
//
// The monitor worker is the only writer of the hash/histogram arrays and of
// last_field_; readers never look past last_field_.
class field_manager {
public:
  field_manager(connector_id id, video_dumper *dumper_a, video_dumper *dumper_b,
                pixel_dump_tool *pixdump, histogram_tool *hist,
                const field_manager_options &opt);
  ~field_manager();

  field_manager(const field_manager&) = delete;
  field_manager& operator=(const field_manager&) = delete;

  // Ends any session and re-selects the dumpers for the given pixel mode.
  void select_path(bool dual);
  bool is_dual() const { return dual_; }

  uint32_t max_field_limit(uint32_t w, uint32_t h) const;
  bool compute_resolution(uint32_t *w, uint32_t *h, cap_error *err);

  bool dump_fields_to_limit(uint32_t limit, const dump_window &win, uint32_t timeout_ms, cap_error *err);
  bool start_dumping_fields(uint32_t buffer_limit, const dump_window &win, uint32_t hash_limit, cap_error *err);
  // Joins the monitor worker, then stops the dumpers. Reports a worker error.
  bool stop_dumping_fields(cap_error *err);

  int field_count() const { return last_field_.load(std::memory_order_acquire); }
  bool is_monitoring() const { return worker_.joinable(); }
  uint32_t buffer_limit() const { return buffer_limit_; }
  // Field size of the current session (whole field, not per path).
  void session_field_size(uint32_t *w, uint32_t *h) const { *w = win_.w; *h = win_.h; }

  bool field_hashes(int start, int stop, std::vector<field_hash> *out, cap_error *err) const;
  bool histograms(int start, int stop, std::vector<std::vector<float>> *out, cap_error *err) const;
  bool read_dumped_field(int index, std::vector<uint8_t> *out, cap_error *err);

private:
  bool check_range(int start, int stop, cap_error *err) const;
  void setup_session(uint32_t buffer_limit, const dump_window &win, uint32_t hash_capacity, bool loop);
  void stop_hardware();
  void start_hardware();
  void stop_monitoring();
  bool poll_fields(uint32_t target, bool *met, cap_error *err);
  bool current_field_count(uint32_t *count, cap_error *err);
  field_hash compute_field_hash(uint32_t index);
  bool compute_histograms(uint32_t first, uint32_t last, cap_error *err);
  uint32_t path_width() const { return dual_ ? win_.w / 2 : win_.w; }
  uint32_t slot_address(video_dumper *vd, uint32_t index) const;
  void attach_register_dump(cap_error *err);

  connector_id id_;
  video_dumper *dumpers_[2];
  std::vector<video_dumper*> active_;
  bool dual_ = false;
  pixel_dump_tool *pixdump_;
  histogram_tool *hist_;
  field_manager_options opt_;

  dump_window win_;
  uint32_t buffer_limit_ = 0;
  uint32_t hash_capacity_ = 0;
  std::vector<uint16_t> saved_hashes_;
  std::vector<float> saved_histograms_;
  std::atomic<int> last_field_{-1};

  std::thread worker_;
  std::atomic<bool> stop_requested_{false};
  std::mutex worker_err_mtx_;
  bool worker_failed_ = false;
  cap_error worker_err_;
};
