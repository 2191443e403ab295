#include "field_manager.h"

#include <algorithm>
#include <cstdio>

#include "wait_util.h"

static const size_t kHashSize = 4;
// Hash words kept by the FPGA before it wraps: 1024 bytes of 32-bit words.
static const uint32_t kHashWords = 256;

bool dump_window_check(const dump_window &win, bool dual, cap_error *err) {
  if (win.w == 0 || win.h == 0)
    return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "empty capture area %ux%u", win.w, win.h);
  if (win.full_screen) return true;
  uint32_t align = dual ? 16 : 8;
  if ((win.x % align) || (win.w % align))
    return cap_fail(err, cap_err_kind::ALIGNMENT,
                    "crop x=%u width=%u not aligned to %u pixels (%s-pixel mode)",
                    win.x, win.w, align, dual ? "dual" : "single");
  return true;
}

field_manager::field_manager(connector_id id, video_dumper *dumper_a, video_dumper *dumper_b,
                             pixel_dump_tool *pixdump, histogram_tool *hist,
                             const field_manager_options &opt)
  : id_(id), pixdump_(pixdump), hist_(hist), opt_(opt) {
  dumpers_[0] = dumper_a;
  dumpers_[1] = dumper_b;
  active_.push_back(dumpers_[video_dumper::primary_index(id_)]);
}

field_manager::~field_manager() {
  stop_monitoring();
}

void field_manager::select_path(bool dual) {
  stop_monitoring();
  dual_ = dual;
  active_.clear();
  for (int i : video_dumper::effective_indexes(id_, dual)) active_.push_back(dumpers_[i]);
  for (video_dumper *vd : active_) vd->select(id_, dual_);
  last_field_.store(-1, std::memory_order_release);
}

uint32_t field_manager::max_field_limit(uint32_t w, uint32_t h) const {
  if (dual_) w /= 2;
  return video_dumper::max_field_limit(w, h);
}

bool field_manager::compute_resolution(uint32_t *w, uint32_t *h, cap_error *err) {
  if (!dual_) {
    *w = active_[0]->width();
    *h = active_[0]->height();
    return true;
  }
  uint32_t w0 = active_[0]->width(), h0 = active_[0]->height();
  uint32_t w1 = active_[1]->width(), h1 = active_[1]->height();
  if (w0 != w1 || h0 != h1) {
    if (opt_.strict_dual_paths)
      return cap_fail(err, cap_err_kind::FSM_FAILURE,
                      "different resolutions between paths: %ux%u != %ux%u", w0, h0, w1, h1);
    fprintf(stderr, "[field] warning: different resolutions between paths: %ux%u != %ux%u\n",
            w0, h0, w1, h1);
  }
  *w = w0 + w1;
  *h = h0;
  return true;
}

void field_manager::stop_hardware() {
  for (video_dumper *vd : active_) vd->stop();
}

void field_manager::start_hardware() {
  for (video_dumper *vd : active_) vd->start(id_, dual_);
}

void field_manager::stop_monitoring() {
  stop_requested_.store(true);
  if (worker_.joinable()) worker_.join();
  stop_requested_.store(false);
}

void field_manager::setup_session(uint32_t buffer_limit, const dump_window &win, uint32_t hash_capacity,
                                  bool loop) {
  stop_hardware();
  win_ = win;
  buffer_limit_ = buffer_limit;
  hash_capacity_ = hash_capacity;
  for (video_dumper *vd : active_) {
    vd->set_dump_address_for_capture();
    vd->set_field_limit(buffer_limit, loop);
    if (win.full_screen) vd->disable_crop();
    else if (dual_) vd->enable_crop(win.x / 2, win.y, win.w / 2, win.h);
    else vd->enable_crop(win.x, win.y, win.w, win.h);
  }
  saved_hashes_.assign((size_t)hash_capacity * kHashSize, 0);
  if (hist_) saved_histograms_.assign((size_t)hash_capacity * kHistogramSize, 0.0f);
  else saved_histograms_.clear();
  {
    std::lock_guard<std::mutex> lk(worker_err_mtx_);
    worker_failed_ = false;
    worker_err_ = cap_error();
  }
}

bool field_manager::current_field_count(uint32_t *count, cap_error *err) {
  uint32_t c0 = active_[0]->field_count();
  if (!dual_) {
    *count = c0;
    return true;
  }
  uint32_t c1 = active_[1]->field_count();
  uint32_t diff = c0 > c1 ? c0 - c1 : c1 - c0;
  if (diff > 1) {
    if (opt_.strict_dual_paths)
      return cap_fail(err, cap_err_kind::FSM_FAILURE, "dual paths out of step: %u != %u fields", c0, c1);
    fprintf(stderr, "[field] warning: dual paths out of step: %u != %u fields\n", c0, c1);
  }
  *count = std::min(c0, c1);
  return true;
}

field_hash field_manager::compute_field_hash(uint32_t index) {
  if (!dual_) return active_[0]->field_hash(index, false);
  // active_[0] carries the even pixels, active_[1] the odd ones.
  field_hash even = active_[0]->field_hash(index, true);
  field_hash odd = active_[1]->field_hash(index, true);
  return {odd[0], even[0], odd[1], even[1]};
}

uint32_t field_manager::slot_address(video_dumper *vd, uint32_t index) const {
  uint32_t slot = buffer_limit_ ? index % buffer_limit_ : 0;
  return vd->capture_address() + slot * video_dumper::aligned_field_size(path_width(), win_.h);
}

bool field_manager::compute_histograms(uint32_t first, uint32_t last, cap_error *err) {
  std::vector<uint32_t> addrs;
  for (uint32_t i = first; i < last; i++)
    for (video_dumper *vd : active_) addrs.push_back(slot_address(vd, i));
  std::vector<std::vector<float>> res;
  if (!hist_->compute(path_width(), win_.h, addrs, &res, err)) return false;
  if (res.size() != addrs.size())
    return cap_fail(err, cap_err_kind::TOOL_FAILURE, "histogram tool returned %zu of %zu histograms",
                    res.size(), addrs.size());
  size_t paths = active_.size();
  for (uint32_t i = first; i < last; i++) {
    float *dst = &saved_histograms_[(size_t)i * kHistogramSize];
    for (size_t k = 0; k < kHistogramSize; k++) {
      float sum = 0.0f;
      for (size_t p = 0; p < paths; p++) sum += res[(i - first) * paths + p][k];
      dst[k] = sum / (float)paths;
    }
  }
  return true;
}

bool field_manager::poll_fields(uint32_t target, bool *met, cap_error *err) {
  uint32_t current = 0;
  if (!current_field_count(&current, err)) return false;
  uint32_t last = (uint32_t)last_field_.load(std::memory_order_relaxed);
  uint32_t upto = std::min(current, hash_capacity_);
  if (upto > last) {
    uint32_t kept = dual_ ? kHashWords : kHashWords / 2;
    if (upto - last > kept)
      return cap_fail(err, cap_err_kind::OVERFLOW,
                      "hash buffer overrun: %u new fields, FPGA keeps %u", upto - last, kept);
    for (uint32_t i = last; i < upto; i++) {
      field_hash h = compute_field_hash(i);
      std::copy(h.begin(), h.end(), saved_hashes_.begin() + (size_t)i * kHashSize);
      fprintf(stderr, "[field] saved field hash #%u: %04x %04x %04x %04x\n", i, h[0], h[1], h[2], h[3]);
    }
    if (hist_ && !compute_histograms(last, upto, err)) return false;
    last_field_.store((int)upto, std::memory_order_release);
  }
  *met = current >= target;
  return true;
}

void field_manager::attach_register_dump(cap_error *err) {
  if (!err) return;
  err->reg_dump.clear();
  for (video_dumper *vd : active_) vd->append_register_dump(err->reg_dump);
}

bool field_manager::dump_fields_to_limit(uint32_t limit, const dump_window &win, uint32_t timeout_ms,
                                         cap_error *err) {
  if (!dump_window_check(win, dual_, err)) return false;
  uint32_t max = max_field_limit(win.w, win.h);
  if (limit == 0 || limit > max)
    return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "field limit %u not in [1, %u]", limit, max);

  stop_monitoring();
  setup_session(limit, win, limit, false);
  last_field_.store(0, std::memory_order_release);
  start_hardware();

  bool ok = wait_for_condition([this, limit](bool *met, cap_error *e) {
    return poll_fields(limit, met, e);
  }, opt_.probe_delay_ms, timeout_ms, "fields to reach the limit", err);
  if (!ok && err && err->kind == cap_err_kind::TIMEOUT) {
    attach_register_dump(err);
    fprintf(stderr, "[field] fields failed to reach %u (got %d)\n%s\n", limit, field_count(),
            cap_dump_to_hex(err->reg_dump).c_str());
  }
  return ok;
}

bool field_manager::start_dumping_fields(uint32_t buffer_limit, const dump_window &win, uint32_t hash_limit,
                                         cap_error *err) {
  if (!dump_window_check(win, dual_, err)) return false;
  uint32_t max = max_field_limit(win.w, win.h);
  if (buffer_limit == 0 || buffer_limit > max)
    return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "field buffer limit %u not in [1, %u]",
                    buffer_limit, max);
  if (hash_limit == 0)
    return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "hash limit must be positive");

  stop_monitoring();
  setup_session(buffer_limit, win, hash_limit, true);
  last_field_.store(0, std::memory_order_release);
  start_hardware();

  // Keep a 5 second margin over hash_limit fields at 60 fields/s.
  uint32_t timeout_ms = (hash_limit / 60 + 5) * 1000;
  worker_ = std::thread([this, hash_limit, timeout_ms]() {
    cap_error e;
    bool ok = wait_for_condition([this, hash_limit](bool *met, cap_error *pe) {
      if (stop_requested_.load()) {
        *met = true;
        return true;
      }
      return poll_fields(hash_limit, met, pe);
    }, opt_.probe_delay_ms, timeout_ms, "monitored fields", &e);
    if (!ok) {
      attach_register_dump(&e);
      std::lock_guard<std::mutex> lk(worker_err_mtx_);
      worker_failed_ = true;
      worker_err_ = e;
    }
    fprintf(stderr, "[field] monitor finished at field %d\n", last_field_.load());
  });
  return true;
}

bool field_manager::stop_dumping_fields(cap_error *err) {
  if (last_field_.load(std::memory_order_acquire) == -1)
    return cap_fail(err, cap_err_kind::INVALID_STATE, "Not started capturing video yet");
  stop_monitoring();
  stop_hardware();
  // Resolution detection needs the dumpers running, so park them again.
  for (video_dumper *vd : active_) vd->select(id_, dual_);

  std::lock_guard<std::mutex> lk(worker_err_mtx_);
  if (worker_failed_) {
    worker_failed_ = false;
    if (err) *err = worker_err_;
    fprintf(stderr, "[field] monitor reported: %s\n", worker_err_.msg.c_str());
    return false;
  }
  return true;
}

bool field_manager::check_range(int start, int stop, cap_error *err) const {
  int last = field_count();
  if (start < 0 || stop < start || stop > last)
    return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "field range [%d, %d) outside [0, %d)",
                    start, stop, last < 0 ? 0 : last);
  return true;
}

bool field_manager::field_hashes(int start, int stop, std::vector<field_hash> *out, cap_error *err) const {
  if (!check_range(start, stop, err)) return false;
  out->clear();
  for (int i = start; i < stop; i++) {
    auto it = saved_hashes_.begin() + (size_t)i * kHashSize;
    out->push_back(field_hash(it, it + kHashSize));
  }
  return true;
}

bool field_manager::histograms(int start, int stop, std::vector<std::vector<float>> *out,
                               cap_error *err) const {
  if (!hist_) return cap_fail(err, cap_err_kind::UNSUPPORTED, "no histogram tool configured");
  if (!check_range(start, stop, err)) return false;
  out->clear();
  for (int i = start; i < stop; i++) {
    auto it = saved_histograms_.begin() + (size_t)i * kHistogramSize;
    out->push_back(std::vector<float>(it, it + kHistogramSize));
  }
  return true;
}

bool field_manager::read_dumped_field(int index, std::vector<uint8_t> *out, cap_error *err) {
  int last = field_count();
  // Only the latest buffer_limit_ fields survive in the ring.
  int first_valid = std::max(0, last - (int)buffer_limit_);
  if (index < first_valid || index >= last)
    return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "field index %d not in [%d, %d)",
                    index, first_valid, last < 0 ? 0 : last);
  const uint32_t bpp = video_dumper::kBytesPerPixel;
  if (!dual_)
    return pixdump_->dump_pixels(slot_address(active_[0], (uint32_t)index), win_.w, win_.h, bpp, out, err);

  uint32_t pw = path_width();
  std::vector<uint8_t> even, odd;
  if (!pixdump_->dump_pixels(slot_address(active_[0], (uint32_t)index), pw, win_.h, bpp, &even, err))
    return false;
  if (!pixdump_->dump_pixels(slot_address(active_[1], (uint32_t)index), pw, win_.h, bpp, &odd, err))
    return false;
  out->assign((size_t)pw * 2 * win_.h * bpp, 0);
  for (uint32_t y = 0; y < win_.h; y++) {
    const uint8_t *e = &even[(size_t)y * pw * bpp];
    const uint8_t *o = &odd[(size_t)y * pw * bpp];
    uint8_t *d = &(*out)[(size_t)y * pw * 2 * bpp];
    for (uint32_t x = 0; x < pw; x++) {
      std::copy(e + x * bpp, e + (x + 1) * bpp, d + (2 * x) * bpp);
      std::copy(o + x * bpp, o + (x + 1) * bpp, d + (2 * x + 1) * bpp);
    }
  }
  return true;
}
