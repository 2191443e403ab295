#pragma once
#include <stdint.h>
#include <functional>
#include <vector>

#include "capture_error.h"
#include "field_manager.h"

// Frame-level view over a field_manager. For interlaced sources a frame is
// two consecutive fields: 2i carries the even lines, 2i+1 the odd lines.
class frame_manager {
public:
  typedef std::function<bool(bool *interlaced, cap_error *err)> interlace_probe;

  frame_manager(field_manager *fields, interlace_probe probe);

  bool compute_resolution(uint32_t *w, uint32_t *h, cap_error *err);
  bool max_frame_limit(uint32_t w, uint32_t h, uint32_t *limit, cap_error *err);

  bool dump_frames_to_limit(uint32_t frame_limit, const dump_window &win, uint32_t timeout_ms, cap_error *err);
  bool start_dumping_frames(uint32_t frame_buffer_limit, const dump_window &win, uint32_t hash_buffer_limit,
                            cap_error *err);
  bool stop_dumping_frames(cap_error *err);

  int dumped_frame_count() const;
  // Frame size of the current session.
  void captured_resolution(uint32_t *w, uint32_t *h) const;
  uint32_t frame_buffer_limit() const;

  bool frame_hashes(int start, int stop, std::vector<field_hash> *out, cap_error *err) const;
  bool histograms(int start, int stop, std::vector<std::vector<float>> *out, cap_error *err) const;
  bool read_dumped_frame(int index, std::vector<uint8_t> *out, cap_error *err);

  bool session_interlaced() const { return interlaced_; }

private:
  bool to_field_window(const dump_window &win, dump_window *out, cap_error *err);

  field_manager *fields_;
  interlace_probe probe_;
  bool interlaced_ = false;
};
