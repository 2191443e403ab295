#include "frame_manager.h"

#include <cstdio>
#include <cstring>

frame_manager::frame_manager(field_manager *fields, interlace_probe probe)
  : fields_(fields), probe_(probe) {}

bool frame_manager::compute_resolution(uint32_t *w, uint32_t *h, cap_error *err) {
  bool interlaced = false;
  if (!probe_(&interlaced, err)) return false;
  if (!fields_->compute_resolution(w, h, err)) return false;
  if (interlaced) *h *= 2;
  return true;
}

bool frame_manager::max_frame_limit(uint32_t w, uint32_t h, uint32_t *limit, cap_error *err) {
  bool interlaced = false;
  if (!probe_(&interlaced, err)) return false;
  if (interlaced) *limit = fields_->max_field_limit(w, h / 2) / 2;
  else *limit = fields_->max_field_limit(w, h);
  return true;
}

bool frame_manager::to_field_window(const dump_window &win, dump_window *out, cap_error *err) {
  // The previous session keeps its interlace flag until this one is valid.
  bool interlaced = false;
  *out = win;
  if (!probe_(&interlaced, err)) return false;
  if (interlaced) {
    if (win.h % 2)
      return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "height %u must be even for interlaced video", win.h);
    if (!win.full_screen && (win.y % 2))
      return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "y %u must be even for interlaced video", win.y);
    out->y = win.y / 2;
    out->h = win.h / 2;
  }
  interlaced_ = interlaced;
  return true;
}

bool frame_manager::dump_frames_to_limit(uint32_t frame_limit, const dump_window &win, uint32_t timeout_ms,
                                         cap_error *err) {
  dump_window fw;
  if (!to_field_window(win, &fw, err)) return false;
  uint32_t field_limit = interlaced_ ? frame_limit * 2 : frame_limit;
  return fields_->dump_fields_to_limit(field_limit, fw, timeout_ms, err);
}

bool frame_manager::start_dumping_frames(uint32_t frame_buffer_limit, const dump_window &win,
                                         uint32_t hash_buffer_limit, cap_error *err) {
  dump_window fw;
  if (!to_field_window(win, &fw, err)) return false;
  if (interlaced_) {
    frame_buffer_limit *= 2;
    hash_buffer_limit *= 2;
  }
  return fields_->start_dumping_fields(frame_buffer_limit, fw, hash_buffer_limit, err);
}

bool frame_manager::stop_dumping_frames(cap_error *err) {
  return fields_->stop_dumping_fields(err);
}

int frame_manager::dumped_frame_count() const {
  int n = fields_->field_count();
  if (n < 0) return 0;
  return interlaced_ ? n / 2 : n;
}

void frame_manager::captured_resolution(uint32_t *w, uint32_t *h) const {
  fields_->session_field_size(w, h);
  if (interlaced_) *h *= 2;
}

uint32_t frame_manager::frame_buffer_limit() const {
  return interlaced_ ? fields_->buffer_limit() / 2 : fields_->buffer_limit();
}

// Field hashes of interlaced captures do not describe whole frames.
bool frame_manager::frame_hashes(int start, int stop, std::vector<field_hash> *out, cap_error *err) const {
  if (interlaced_)
    return cap_fail(err, cap_err_kind::UNSUPPORTED, "frame hashes of interlaced video are not supported");
  return fields_->field_hashes(start, stop, out, err);
}

bool frame_manager::histograms(int start, int stop, std::vector<std::vector<float>> *out,
                               cap_error *err) const {
  if (interlaced_)
    return cap_fail(err, cap_err_kind::UNSUPPORTED, "histograms of interlaced video are not supported");
  return fields_->histograms(start, stop, out, err);
}

bool frame_manager::read_dumped_frame(int index, std::vector<uint8_t> *out, cap_error *err) {
  if (!interlaced_) return fields_->read_dumped_field(index, out, err);
  if (index < 0) return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "frame index %d", index);

  std::vector<uint8_t> even, odd;
  if (!fields_->read_dumped_field(index * 2, &even, err)) return false;
  if (!fields_->read_dumped_field(index * 2 + 1, &odd, err)) return false;
  uint32_t w = 0, field_h = 0;
  fields_->session_field_size(&w, &field_h);
  if (even.size() != odd.size() || field_h == 0 || even.size() % field_h)
    return cap_fail(err, cap_err_kind::TOOL_FAILURE, "field sizes differ: %zu vs %zu", even.size(), odd.size());
  size_t line = even.size() / field_h;
  out->resize(even.size() * 2);
  for (uint32_t y = 0; y < field_h; y++) {
    memcpy(&(*out)[(size_t)(2 * y) * line], &even[(size_t)y * line], line);
    memcpy(&(*out)[(size_t)(2 * y + 1) * line], &odd[(size_t)y * line], line);
  }
  return true;
}
