#include "capture_service.h"

#include <dirent.h>
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>

#include "jpeg_thumbnail.h"
#include "wait_util.h"

static bool ensure_dir(const std::string &path, cap_error *err) {
  if (path.empty()) return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "empty directory path");
  for (size_t pos = 1; pos <= path.size(); pos++) {
    if (pos != path.size() && path[pos] != '/') continue;
    std::string part = path.substr(0, pos);
    if (::mkdir(part.c_str(), 0755) != 0 && errno != EEXIST)
      return cap_fail(err, cap_err_kind::INVALID_STATE, "mkdir %s failed: %s", part.c_str(), strerror(errno));
  }
  return true;
}

std::vector<int> capture_service::supported_inputs() const {
  std::vector<int> out;
  for (const auto &kv : flows_) out.push_back(kv.first);
  return out;
}

bool capture_service::flow_for(int port, input_flow **flow, cap_error *err) {
  auto it = flows_.find(port);
  if (it == flows_.end())
    return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "Not a valid input_id: %d", port);
  *flow = it->second;
  return true;
}

bool capture_service::captured_flow(input_flow **flow, cap_error *err) {
  if (captured_port_ < 0)
    return cap_fail(err, cap_err_kind::INVALID_STATE, "Capture not started");
  return flow_for(captured_port_, flow, err);
}

bool capture_service::connector_type(int port, std::string *type, cap_error *err) {
  input_flow *flow = nullptr;
  if (!flow_for(port, &flow, err)) return false;
  *type = flow->connector_type();
  return true;
}

// All flows share the two dumpers, so only the flow being routed may keep a
// monitor worker or a capture session.
void capture_service::release_other_flows(int port) {
  for (auto &kv : flows_) {
    if (kv.first == port || !kv.second->fields()->is_monitoring()) continue;
    cap_error stop_err;
    if (!kv.second->frames()->stop_dumping_frames(&stop_err))
      fprintf(stderr, "[capture] stopping port %d: %s\n", kv.first, stop_err.msg.c_str());
  }
  if (captured_port_ >= 0 && captured_port_ != port) {
    fprintf(stderr, "[capture] port %d session dropped for port %d\n", captured_port_, port);
    captured_port_ = -1;
    captured_max_limit_ = 0;
  }
}

bool capture_service::select_input(int port, cap_error *err) {
  input_flow *flow = nullptr;
  if (!flow_for(port, &flow, err)) return false;
  if (port != selected_) {
    release_other_flows(port);
    if (!flow->select(err)) return false;
    selected_ = port;
  }
  return flow->do_fsm(err);
}

bool capture_service::is_plugged(int port, bool *plugged, cap_error *err) {
  input_flow *flow = nullptr;
  if (!flow_for(port, &flow, err)) return false;
  return flow->is_plugged(plugged, err);
}

bool capture_service::plug(int port, cap_error *err) {
  input_flow *flow = nullptr;
  if (!flow_for(port, &flow, err)) return false;
  return flow->plug(err);
}

bool capture_service::unplug(int port, cap_error *err) {
  input_flow *flow = nullptr;
  if (!flow_for(port, &flow, err)) return false;
  return flow->unplug(err);
}

bool capture_service::is_physical_plugged(int port, bool *plugged, cap_error *err) {
  input_flow *flow = nullptr;
  if (!flow_for(port, &flow, err)) return false;
  return flow->is_physical_plugged(plugged, err);
}

bool capture_service::fire_hpd_pulse(int port, uint32_t deassert_us, uint32_t assert_us, int repeat_count,
                                     int end_level, cap_error *err) {
  input_flow *flow = nullptr;
  if (!flow_for(port, &flow, err)) return false;
  return flow->fire_hpd_pulse(deassert_us, assert_us, repeat_count, end_level, err);
}

bool capture_service::fire_mixed_hpd_pulses(int port, const std::vector<uint32_t> &widths_ms, cap_error *err) {
  input_flow *flow = nullptr;
  if (!flow_for(port, &flow, err)) return false;
  std::vector<uint32_t> widths_us;
  widths_us.reserve(widths_ms.size());
  for (uint32_t ms : widths_ms) {
    uint64_t us = (uint64_t)ms * 1000;
    if (us > UINT32_MAX)
      return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "pulse width %u ms is too long", ms);
    widths_us.push_back((uint32_t)us);
  }
  return flow->fire_mixed_hpd_pulses(widths_us, err);
}

bool capture_service::wait_video_input_stable(int port, uint32_t timeout_ms, bool *stable, cap_error *err) {
  if (!select_input(port, err)) return false;
  return flows_[port]->wait_video_input_stable(timeout_ms, stable, err);
}

bool capture_service::detect_resolution(int port, uint32_t *w, uint32_t *h, cap_error *err) {
  if (!select_input(port, err)) return false;
  return flows_[port]->detect_resolution(w, h, err);
}

bool capture_service::set_vga_mode(int port, const std::string &mode, cap_error *err) {
  input_flow *flow = nullptr;
  if (!flow_for(port, &flow, err)) return false;
  return flow->set_vga_mode(mode, err);
}

bool capture_service::get_max_frame_limit(int port, uint32_t w, uint32_t h, uint32_t *limit, cap_error *err) {
  input_flow *flow = nullptr;
  if (!flow_for(port, &flow, err)) return false;
  return flow->frames()->max_frame_limit(w, h, limit, err);
}

// Either the whole area is given, only the size is given, or nothing is.
bool capture_service::auto_fill_area(int port, const capture_area &area, dump_window *win, cap_error *err) {
  *win = dump_window();
  if (!area.has_x && !area.has_y && !area.has_w && !area.has_h) {
    if (!detect_resolution(port, &win->w, &win->h, err)) return false;
    win->full_screen = true;
    return true;
  }
  if (!area.has_x && !area.has_y && area.has_w && area.has_h) {
    win->full_screen = true;
    win->w = area.w;
    win->h = area.h;
    return true;
  }
  if (area.has_x && area.has_y && area.has_w && area.has_h) {
    win->full_screen = false;
    win->x = area.x;
    win->y = area.y;
    win->w = area.w;
    win->h = area.h;
    return true;
  }
  return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "Some of area arguments are not specified.");
}

void capture_service::clear_thumbnails() {
  DIR *d = opendir(opt_.thumbnail_dir.c_str());
  if (!d) return;
  while (struct dirent *e = readdir(d)) {
    if (!strcmp(e->d_name, ".") || !strcmp(e->d_name, "..")) continue;
    std::string p = opt_.thumbnail_dir + "/" + e->d_name;
    if (::unlink(p.c_str()) != 0)
      fprintf(stderr, "[capture] unlink %s: %s\n", p.c_str(), strerror(errno));
  }
  closedir(d);
  next_thumbnail_id_ = 0;
}

bool capture_service::prepare_capturing(int port, const dump_window &win, cap_error *err) {
  clear_thumbnails();
  release_other_flows(port);
  if (!select_input(port, err)) return false;
  bool plugged = false;
  if (!flows_[port]->is_plugged(&plugged, err)) return false;
  if (!plugged)
    return cap_fail(err, cap_err_kind::PORT_NOT_PLUGGED, "HPD is unplugged. No signal is expected.");
  uint32_t limit = 0;
  if (!get_max_frame_limit(port, win.w, win.h, &limit, err)) return false;
  captured_port_ = port;
  captured_max_limit_ = limit;
  return true;
}

bool capture_service::capture_video(int port, uint32_t total_frame, const capture_area &area, cap_error *err) {
  dump_window win;
  if (!auto_fill_area(port, area, &win, err)) return false;
  if (!prepare_capturing(port, win, err)) return false;
  if (total_frame > captured_max_limit_)
    return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "Exceed the limit of memory. total_frame(%u) > max_limit(%u)",
                    total_frame, captured_max_limit_);
  fprintf(stderr, "[capture] capture %u frames on port %d (%ux%u)\n", total_frame, port, win.w, win.h);
  return flows_[port]->frames()->dump_frames_to_limit(total_frame, win, opt_.frame_dump_timeout_ms, err);
}

bool capture_service::start_capturing_video(int port, const capture_area &area, cap_error *err) {
  dump_window win;
  if (!auto_fill_area(port, area, &win, err)) return false;
  if (!prepare_capturing(port, win, err)) return false;
  fprintf(stderr, "[capture] start capturing port %d (%ux%u), ring %u frames\n", port, win.w, win.h,
          captured_max_limit_);
  return flows_[port]->frames()->start_dumping_frames(captured_max_limit_, win, opt_.max_captured_frames, err);
}

bool capture_service::stop_capturing_video(uint32_t stop_index, cap_error *err) {
  input_flow *flow = nullptr;
  if (!captured_flow(&flow, err)) return false;
  frame_manager *frames = flow->frames();
  if (stop_index) {
    if (stop_index >= opt_.max_captured_frames)
      return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "Exceeded the limit of capture, stop_index >= %u",
                      opt_.max_captured_frames);
    uint32_t timeout_ms = (stop_index / 60 + 5) * 1000;
    cap_error wait_err;
    bool waited = wait_for_condition(
        [frames, stop_index](bool *met, cap_error *) {
          *met = frames->dumped_frame_count() >= (int)stop_index;
          return true;
        },
        5, timeout_ms, "frame count to reach stop index", &wait_err);
    if (!waited) {
      // Always stop the session; the wait error wins over a stop error.
      cap_error stop_err;
      if (!frames->stop_dumping_frames(&stop_err))
        fprintf(stderr, "[capture] stop after wait failure: %s\n", stop_err.msg.c_str());
      if (err) *err = wait_err;
      return false;
    }
  }
  if (!frames->stop_dumping_frames(err)) return false;
  int count = frames->dumped_frame_count();
  if (count >= (int)opt_.max_captured_frames)
    return cap_fail(err, cap_err_kind::OVERFLOW, "Exceeded the limit of capture, frame_count (%d) >= %u",
                    count, opt_.max_captured_frames);
  return true;
}

bool capture_service::get_captured_frame_count(int *count, cap_error *err) {
  input_flow *flow = nullptr;
  if (!captured_flow(&flow, err)) return false;
  *count = flow->frames()->dumped_frame_count();
  return true;
}

bool capture_service::get_captured_resolution(uint32_t *w, uint32_t *h, cap_error *err) {
  input_flow *flow = nullptr;
  if (!captured_flow(&flow, err)) return false;
  flow->frames()->captured_resolution(w, h);
  return true;
}

bool capture_service::read_captured_frame(int index, std::vector<uint8_t> *out, cap_error *err) {
  input_flow *flow = nullptr;
  if (!captured_flow(&flow, err)) return false;
  int total = flow->frames()->dumped_frame_count();
  int first = std::max(0, total - (int)captured_max_limit_);
  if (index < first || index >= total)
    return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "The frame index is out-of-range: %d not in [%d, %d)",
                    index, first, total);
  return flow->frames()->read_dumped_frame(index, out, err);
}

static bool check_range(int start, int *stop, int total, cap_error *err) {
  if (*stop < 0) *stop = total;
  if (start < 0 || start >= total)
    return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "The start index is out-of-range: %d not in [0, %d)",
                    start, total);
  if (*stop <= 0 || *stop > total)
    return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "The stop index is out-of-range: %d not in (0, %d]",
                    *stop, total);
  return true;
}

bool capture_service::get_captured_checksums(int start, int stop, std::vector<field_hash> *out, cap_error *err) {
  input_flow *flow = nullptr;
  if (!captured_flow(&flow, err)) return false;
  if (!check_range(start, &stop, flow->frames()->dumped_frame_count(), err)) return false;
  return flow->frames()->frame_hashes(start, stop, out, err);
}

bool capture_service::get_captured_histograms(int start, int stop, std::vector<std::vector<float>> *out,
                                              cap_error *err) {
  input_flow *flow = nullptr;
  if (!captured_flow(&flow, err)) return false;
  if (!check_range(start, &stop, flow->frames()->dumped_frame_count(), err)) return false;
  return flow->frames()->histograms(start, stop, out, err);
}

bool capture_service::compute_pixel_checksum(int port, const capture_area &area, field_hash *out, cap_error *err) {
  if (!capture_video(port, 1, area, err)) return false;
  std::vector<field_hash> hashes;
  if (!get_captured_checksums(0, 1, &hashes, err)) return false;
  *out = hashes[0];
  return true;
}

bool capture_service::dump_pixels(int port, const capture_area &area, std::vector<uint8_t> *out, cap_error *err) {
  if (!capture_video(port, 1, area, err)) return false;
  return read_captured_frame(0, out, err);
}

std::string capture_service::thumbnail_path(int id) const {
  char name[32];
  snprintf(name, sizeof(name), "/%d.jpg", id);
  return opt_.thumbnail_dir + name;
}

bool capture_service::cache_frame_thumbnail(int index, int ratio, int *id, cap_error *err) {
  if (ratio < 1) return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "bad ratio %d", ratio);
  std::vector<uint8_t> rgb;
  if (!read_captured_frame(index, &rgb, err)) return false;
  uint32_t w = 0, h = 0;
  if (!get_captured_resolution(&w, &h, err)) return false;
  if (rgb.size() != (size_t)w * h * 3)
    return cap_fail(err, cap_err_kind::TOOL_FAILURE, "frame size %zu does not match %ux%u", rgb.size(), w, h);

  std::vector<uint8_t> small, jpeg;
  int sw = 0, sh = 0;
  if (!downscale_rgb(rgb, (int)w, (int)h, ratio, small, &sw, &sh))
    return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "cannot downscale %ux%u by %d", w, h, ratio);
  if (!encode_rgb_to_jpeg(small.data(), sw, sh, opt_.thumbnail_quality, jpeg))
    return cap_fail(err, cap_err_kind::TOOL_FAILURE, "jpeg encode failed");

  if (!ensure_dir(opt_.thumbnail_dir, err)) return false;
  int new_id = next_thumbnail_id_;
  std::string path = thumbnail_path(new_id);
  FILE *f = fopen(path.c_str(), "wb");
  if (!f) return cap_fail(err, cap_err_kind::INVALID_STATE, "open %s: %s", path.c_str(), strerror(errno));
  size_t n = fwrite(jpeg.data(), 1, jpeg.size(), f);
  bool ok = (n == jpeg.size());
  if (fclose(f) != 0) ok = false;
  if (!ok) return cap_fail(err, cap_err_kind::INVALID_STATE, "write %s failed", path.c_str());
  next_thumbnail_id_++;
  *id = new_id;
  return true;
}

bool capture_service::start_capturing_audio(int port, bool has_file, cap_error *err) {
  input_flow *flow = nullptr;
  if (!flow_for(port, &flow, err)) return false;
  if (!flow->has_audio())
    return cap_fail(err, cap_err_kind::UNSUPPORTED, "Not a valid port for audio capture: %d", port);
  if (!audio_) return cap_fail(err, cap_err_kind::INVALID_STATE, "audio capture not configured");

  std::string path;
  if (has_file) {
    if (!ensure_dir(opt_.audio_dump_dir, err)) return false;
    std::string tmpl = opt_.audio_dump_dir + "/audio_XXXXXX.raw";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    int fd = mkstemps(buf.data(), 4);
    if (fd < 0) return cap_fail(err, cap_err_kind::INVALID_STATE, "mkstemps %s: %s", tmpl.c_str(), strerror(errno));
    ::close(fd);
    path = buf.data();
  }
  if (!flow->reset_audio_logic(err)) return false;
  if (!audio_->start(path, err)) return false;
  audio_port_ = port;
  fprintf(stderr, "[capture] audio capture started on port %d%s%s\n", port, path.empty() ? "" : " -> ",
          path.c_str());
  return true;
}

bool capture_service::stop_capturing_audio(int port, std::string *path, audio_data_format *fmt, cap_error *err) {
  input_flow *flow = nullptr;
  if (!flow_for(port, &flow, err)) return false;
  if (!flow->has_audio())
    return cap_fail(err, cap_err_kind::UNSUPPORTED, "Not a valid port for audio capture: %d", port);
  if (!audio_) return cap_fail(err, cap_err_kind::INVALID_STATE, "audio capture not configured");
  if (audio_port_ != port)
    return cap_fail(err, cap_err_kind::INVALID_STATE, "Audio capture not started on port %d", port);
  if (!audio_->stop(fmt, err)) return false;
  audio_port_ = -1;
  *path = audio_->file_path();
  return true;
}
