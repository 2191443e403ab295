#pragma once
#include <stdint.h>
#include <map>
#include <string>
#include <vector>

#include "audio_capture.h"
#include "capture_error.h"
#include "field_manager.h"
#include "input_flow.h"

// Capture area as given by a caller; absent fields are filled from the
// detected resolution.
struct capture_area {
  bool has_x = false, has_y = false, has_w = false, has_h = false;
  uint32_t x = 0, y = 0, w = 0, h = 0;
};

struct capture_service_options {
  uint32_t max_captured_frames = 3 * 60 * 60;   // one hour at 60 fps
  uint32_t frame_dump_timeout_ms = 60000;
  std::string thumbnail_dir = "/tmp/chameleond/thumbnails";
  std::string audio_dump_dir = "/tmp";
  int thumbnail_quality = 85;
};

// The RPC-facing operations of the capture daemon. Not thread-safe; the RPC
// layer serializes calls.
class capture_service {
public:
  explicit capture_service(const capture_service_options &opt) : opt_(opt) {}

  void add_flow(input_flow *flow) { flows_[(int)flow->id()] = flow; }
  void set_audio(audio_capture_manager *audio) { audio_ = audio; }
  const capture_service_options &options() const { return opt_; }

  std::vector<int> supported_inputs() const;
  bool connector_type(int port, std::string *type, cap_error *err);
  int selected_input() const { return selected_; }

  // Routes the port if needed and runs its link FSM. Routing another port
  // ends the capture session of the previous one.
  bool select_input(int port, cap_error *err);

  bool is_plugged(int port, bool *plugged, cap_error *err);
  bool plug(int port, cap_error *err);
  bool unplug(int port, cap_error *err);
  bool is_physical_plugged(int port, bool *plugged, cap_error *err);
  bool fire_hpd_pulse(int port, uint32_t deassert_us, uint32_t assert_us, int repeat_count, int end_level,
                      cap_error *err);
  bool fire_mixed_hpd_pulses(int port, const std::vector<uint32_t> &widths_ms, cap_error *err);
  bool wait_video_input_stable(int port, uint32_t timeout_ms, bool *stable, cap_error *err);
  bool detect_resolution(int port, uint32_t *w, uint32_t *h, cap_error *err);
  bool set_vga_mode(int port, const std::string &mode, cap_error *err);

  bool get_max_frame_limit(int port, uint32_t w, uint32_t h, uint32_t *limit, cap_error *err);
  // Synchronous capture of total_frame frames.
  bool capture_video(int port, uint32_t total_frame, const capture_area &area, cap_error *err);
  bool start_capturing_video(int port, const capture_area &area, cap_error *err);
  // stop_index > 0 first waits for that many frames; frame stop_index itself
  // should not be read.
  bool stop_capturing_video(uint32_t stop_index, cap_error *err);

  bool get_captured_frame_count(int *count, cap_error *err);
  bool get_captured_resolution(uint32_t *w, uint32_t *h, cap_error *err);
  bool read_captured_frame(int index, std::vector<uint8_t> *out, cap_error *err);
  // stop < 0 means the captured frame count.
  bool get_captured_checksums(int start, int stop, std::vector<field_hash> *out, cap_error *err);
  bool get_captured_histograms(int start, int stop, std::vector<std::vector<float>> *out, cap_error *err);
  bool compute_pixel_checksum(int port, const capture_area &area, field_hash *out, cap_error *err);
  bool dump_pixels(int port, const capture_area &area, std::vector<uint8_t> *out, cap_error *err);

  bool cache_frame_thumbnail(int index, int ratio, int *id, cap_error *err);
  std::string thumbnail_path(int id) const;

  bool start_capturing_audio(int port, bool has_file, cap_error *err);
  // *path is empty when the capture was started without a file.
  bool stop_capturing_audio(int port, std::string *path, audio_data_format *fmt, cap_error *err);

  // Also used by the status endpoint.
  bool has_capture() const { return captured_port_ >= 0; }
  int captured_port() const { return captured_port_; }
  uint32_t captured_max_frame_limit() const { return captured_max_limit_; }

private:
  bool flow_for(int port, input_flow **flow, cap_error *err);
  bool captured_flow(input_flow **flow, cap_error *err);
  bool auto_fill_area(int port, const capture_area &area, dump_window *win, cap_error *err);
  bool prepare_capturing(int port, const dump_window &win, cap_error *err);
  void release_other_flows(int port);
  void clear_thumbnails();

  capture_service_options opt_;
  std::map<int, input_flow*> flows_;
  audio_capture_manager *audio_ = nullptr;
  int selected_ = -1;
  int captured_port_ = -1;
  uint32_t captured_max_limit_ = 0;
  int next_thumbnail_id_ = 0;
  int audio_port_ = -1;
};
