#pragma once
#include <stdint.h>
#include <string>

#include "link_fsm.h"

struct persisted_config {
  std::string listen_addr = "0.0.0.0";
  int rpc_port = 9992;
  std::string i2c_bus = "/dev/i2c-0";

  bool strict_dual_paths = false;
  uint32_t frame_dump_timeout_sec = 60;
  uint32_t max_captured_frames = 3 * 60 * 60;

  std::string audio_dump_dir = "/tmp";
  std::string thumbnail_dir = "/tmp/chameleond/thumbnails";
  int thumbnail_quality = 85;

  std::string pixeldump_path = "/usr/bin/pixeldump";
  std::string histogram_path = "/usr/bin/histogram";

  // "auto" or a known VGA mode name.
  std::string vga_mode = "auto";

  pixel_mode_hysteresis dp_hysteresis = dp_link_fsm::default_hysteresis();
  pixel_mode_hysteresis hdmi_hysteresis = hdmi_link_fsm::default_hysteresis();
};

// Clamps out-of-range values back to defaults.
void cfg_normalize(persisted_config &c);

std::string config_to_json(const persisted_config &c_in);
// Lenient: keys that are missing or of the wrong type keep their value.
bool config_from_json_text(const std::string &text, persisted_config &c);
