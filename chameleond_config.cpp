#include "chameleond_config.h"

#include <stdio.h>

#include <nlohmann/json.hpp>

using nlohmann::json;

static void normalize_hysteresis(pixel_mode_hysteresis &h, const pixel_mode_hysteresis &def, const char *name) {
  if (h.low_mhz <= 0 || h.high_mhz <= 0 || h.low_mhz > h.high_mhz) {
    fprintf(stderr, "[config] invalid %s hysteresis %.1f..%.1f, using %.1f..%.1f\n", name, h.low_mhz, h.high_mhz,
            def.low_mhz, def.high_mhz);
    h = def;
  }
}

void cfg_normalize(persisted_config &c) {
  if (c.listen_addr.empty()) c.listen_addr = "0.0.0.0";
  if (c.rpc_port <= 0 || c.rpc_port > 65535) c.rpc_port = 9992;
  if (c.frame_dump_timeout_sec == 0) c.frame_dump_timeout_sec = 60;
  if (c.max_captured_frames == 0) c.max_captured_frames = 3 * 60 * 60;
  if (c.thumbnail_quality < 1) c.thumbnail_quality = 1;
  if (c.thumbnail_quality > 100) c.thumbnail_quality = 100;
  if (c.audio_dump_dir.empty()) c.audio_dump_dir = "/tmp";
  if (c.thumbnail_dir.empty()) c.thumbnail_dir = "/tmp/chameleond/thumbnails";
  if (c.vga_mode.empty()) c.vga_mode = "auto";
  normalize_hysteresis(c.dp_hysteresis, dp_link_fsm::default_hysteresis(), "dp");
  normalize_hysteresis(c.hdmi_hysteresis, hdmi_link_fsm::default_hysteresis(), "hdmi");
}

static json hysteresis_json(const pixel_mode_hysteresis &h) {
  json o;
  o["lowMhz"] = h.low_mhz;
  o["highMhz"] = h.high_mhz;
  return o;
}

std::string config_to_json(const persisted_config &c_in) {
  persisted_config c = c_in;
  cfg_normalize(c);

  json j;
  j["listenAddr"] = c.listen_addr;
  j["rpcPort"] = c.rpc_port;
  j["i2cBus"] = c.i2c_bus;
  j["strictDualPaths"] = c.strict_dual_paths;
  j["frameDumpTimeoutSec"] = c.frame_dump_timeout_sec;
  j["maxCapturedFrames"] = c.max_captured_frames;
  j["audioDumpDir"] = c.audio_dump_dir;
  j["thumbnailDir"] = c.thumbnail_dir;
  j["thumbnailQuality"] = c.thumbnail_quality;
  j["pixeldumpPath"] = c.pixeldump_path;
  j["histogramPath"] = c.histogram_path;
  j["vgaMode"] = c.vga_mode;

  json hyst;
  hyst["dp"] = hysteresis_json(c.dp_hysteresis);
  hyst["hdmi"] = hysteresis_json(c.hdmi_hysteresis);
  j["hysteresis"] = hyst;

  return j.dump(2);
}

bool config_from_json_text(const std::string &text, persisted_config &c) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return false;

  auto get_str = [&](const char *k, std::string &out) {
    if (j.contains(k) && j[k].is_string()) out = j[k].get<std::string>();
  };
  auto get_bool = [&](const char *k, bool &out) {
    if (j.contains(k) && j[k].is_boolean()) out = j[k].get<bool>();
  };
  auto get_int = [&](const char *k, int &out) {
    if (j.contains(k) && j[k].is_number_integer()) out = j[k].get<int>();
  };
  auto get_u32 = [&](const char *k, uint32_t &out) {
    if (j.contains(k) && j[k].is_number_integer()) {
      long long v = j[k].get<long long>();
      if (v >= 0 && v <= 0xFFFFFFFFll) out = (uint32_t)v;
    }
  };

  get_str("listenAddr", c.listen_addr);
  get_int("rpcPort", c.rpc_port);
  get_str("i2cBus", c.i2c_bus);
  get_bool("strictDualPaths", c.strict_dual_paths);
  get_u32("frameDumpTimeoutSec", c.frame_dump_timeout_sec);
  get_u32("maxCapturedFrames", c.max_captured_frames);
  get_str("audioDumpDir", c.audio_dump_dir);
  get_str("thumbnailDir", c.thumbnail_dir);
  get_int("thumbnailQuality", c.thumbnail_quality);
  get_str("pixeldumpPath", c.pixeldump_path);
  get_str("histogramPath", c.histogram_path);
  get_str("vgaMode", c.vga_mode);

  if (j.contains("hysteresis") && j["hysteresis"].is_object()) {
    const auto &hj = j["hysteresis"];
    auto get_hyst = [&](const char *k, pixel_mode_hysteresis &out) {
      if (!hj.contains(k) || !hj[k].is_object()) return;
      const auto &o = hj[k];
      if (o.contains("lowMhz") && o["lowMhz"].is_number()) out.low_mhz = o["lowMhz"].get<double>();
      if (o.contains("highMhz") && o["highMhz"].is_number()) out.high_mhz = o["highMhz"].get<double>();
    };
    get_hyst("dp", c.dp_hysteresis);
    get_hyst("hdmi", c.hdmi_hysteresis);
  }

  cfg_normalize(c);
  return true;
}
