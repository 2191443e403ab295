#include "chameleond_rpc.h"

#include <atomic>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "capture_service.h"

using nlohmann::json;

static std::mutex g_mtx;
// Held for the whole of each call into the capture service.
static std::mutex g_call_mtx;

static capture_service *g_svc = nullptr;
static std::string (*g_cfg_json)() = nullptr;
static std::string (*g_status)() = nullptr;
static std::atomic<bool> *g_quit = nullptr;
static std::string g_listen_addr = "0.0.0.0";

void rpc_set_service(capture_service *svc) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_svc = svc;
}

static capture_service *current_service() {
  std::lock_guard<std::mutex> lk(g_mtx);
  return g_svc;
}

void rpc_exclusive(const std::function<void()> &fn) {
  std::lock_guard<std::mutex> call(g_call_mtx);
  fn();
}

void rpc_call(const std::string &method, const std::string &body, rpc_reply &out) {
  std::lock_guard<std::mutex> call(g_call_mtx);
  capture_service *svc = current_service();
  if (!svc) {
    out.http_status = 500;
    out.content_type = "application/json";
    out.body = "{\"error\":\"no capture service\"}";
    return;
  }
  rpc_dispatch(*svc, method, body, out);
}

void rpc_set_config_json_provider(std::string (*fn)()) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_cfg_json = fn;
}
void rpc_set_status_provider(std::string (*fn)()) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_status = fn;
}
void rpc_set_quit_flag(std::atomic<bool> *quit_flag) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_quit = quit_flag;
}
void rpc_set_listen_address(const std::string &addr) {
  std::lock_guard<std::mutex> lk(g_mtx);
  g_listen_addr = addr;
}

int rpc_http_status(cap_err_kind kind) {
  switch (kind) {
    case cap_err_kind::NONE: return 200;
    case cap_err_kind::INVALID_ARGUMENT:
    case cap_err_kind::ALIGNMENT: return 400;
    case cap_err_kind::CABLE_DISCONNECTED:
    case cap_err_kind::PORT_NOT_PLUGGED:
    case cap_err_kind::FSM_FAILURE:
    case cap_err_kind::INVALID_STATE:
    case cap_err_kind::OVERFLOW: return 409;
    case cap_err_kind::UNSUPPORTED: return 501;
    case cap_err_kind::TIMEOUT: return 504;
    case cap_err_kind::BUS:
    case cap_err_kind::TOOL_FAILURE: return 500;
  }
  return 500;
}

// Messages can carry caller strings cut at any byte.
static std::string reply_dump(const json &j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

static void set_error(rpc_reply &out, int status, const std::string &kind, const std::string &msg,
                      const std::vector<uint8_t> &reg_dump = std::vector<uint8_t>()) {
  json j;
  j["error"] = msg;
  j["kind"] = kind;
  if (!reg_dump.empty()) j["registers"] = cap_dump_to_hex(reg_dump);
  out.http_status = status;
  out.content_type = "application/json";
  out.body = reply_dump(j);
}

static void set_error(rpc_reply &out, const cap_error &err) {
  set_error(out, rpc_http_status(err.kind), cap_err_kind_name(err.kind), err.msg, err.reg_dump);
}

// Typed access to the call arguments.
class rpc_args {
public:
  explicit rpc_args(const json &j) : j_(j) {}

  bool has(const char *k) const { return j_.contains(k) && !j_[k].is_null(); }

  bool get_int(const char *k, int *out, cap_error *err) const {
    long long v = 0;
    if (!get_ranged(k, INT_MIN, INT_MAX, &v, err)) return false;
    *out = (int)v;
    return true;
  }
  bool get_u32(const char *k, uint32_t *out, cap_error *err) const {
    long long v = 0;
    if (!get_ranged(k, 0, UINT32_MAX, &v, err)) return false;
    *out = (uint32_t)v;
    return true;
  }
  bool opt_int(const char *k, int def, int *out, cap_error *err) const {
    if (!has(k)) {
      *out = def;
      return true;
    }
    return get_int(k, out, err);
  }
  bool opt_bool(const char *k, bool def, bool *out, cap_error *err) const {
    if (!has(k)) {
      *out = def;
      return true;
    }
    if (!j_[k].is_boolean())
      return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "argument '%s' must be a boolean", k);
    *out = j_[k].get<bool>();
    return true;
  }
  bool get_str(const char *k, std::string *out, cap_error *err) const {
    if (!has(k) || !j_[k].is_string())
      return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "missing string argument '%s'", k);
    *out = j_[k].get<std::string>();
    return true;
  }
  bool get_u32_list(const char *k, std::vector<uint32_t> *out, cap_error *err) const {
    if (!has(k) || !j_[k].is_array())
      return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "missing list argument '%s'", k);
    out->clear();
    for (const auto &v : j_[k]) {
      long long n = 0;
      if (!ranged(v, k, 0, UINT32_MAX, &n, err)) return false;
      out->push_back((uint32_t)n);
    }
    return true;
  }
  bool area(capture_area *a, cap_error *err) const {
    *a = capture_area();
    if ((a->has_x = has("x")) && !get_u32("x", &a->x, err)) return false;
    if ((a->has_y = has("y")) && !get_u32("y", &a->y, err)) return false;
    if ((a->has_w = has("width")) && !get_u32("width", &a->w, err)) return false;
    if ((a->has_h = has("height")) && !get_u32("height", &a->h, err)) return false;
    return true;
  }

private:
  bool get_ranged(const char *k, long long lo, long long hi, long long *out, cap_error *err) const {
    if (!has(k)) return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "missing argument '%s'", k);
    return ranged(j_[k], k, lo, hi, out, err);
  }
  // JSON integers are 64-bit; anything outside [lo, hi] is rejected rather
  // than narrowed.
  static bool ranged(const json &v, const char *k, long long lo, long long hi, long long *out, cap_error *err) {
    if (!v.is_number_integer())
      return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "argument '%s' must be an integer", k);
    bool in_range = v.is_number_unsigned() ? v.get<unsigned long long>() <= (unsigned long long)hi
                                           : v.get<long long>() >= lo && v.get<long long>() <= hi;
    if (!in_range)
      return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "argument '%s' out of range [%lld, %lld]", k, lo, hi);
    *out = v.get<long long>();
    return true;
  }

  const json &j_;
};

typedef bool (*rpc_handler)(capture_service &svc, const rpc_args &a, json &result, rpc_reply &out,
                            cap_error *err);

static json hash_json(const field_hash &h) {
  json arr = json::array();
  for (uint16_t v : h) arr.push_back(v);
  return arr;
}

static void set_binary(rpc_reply &out, const std::vector<uint8_t> &data) {
  out.content_type = "application/octet-stream";
  out.body.assign(reinterpret_cast<const char*>(data.data()), data.size());
}

static bool h_supported_inputs(capture_service &svc, const rpc_args &, json &result, rpc_reply &, cap_error *) {
  result = svc.supported_inputs();
  return true;
}

static bool h_connector_type(capture_service &svc, const rpc_args &a, json &result, rpc_reply &, cap_error *err) {
  int port = 0;
  std::string type;
  if (!a.get_int("port_id", &port, err) || !svc.connector_type(port, &type, err)) return false;
  result = type;
  return true;
}

static bool h_has_audio(capture_service &svc, const rpc_args &a, json &result, rpc_reply &, cap_error *err) {
  int port = 0;
  std::string type;
  if (!a.get_int("port_id", &port, err) || !svc.connector_type(port, &type, err)) return false;
  result = (port == CONN_HDMI);
  return true;
}

static bool h_select_input(capture_service &svc, const rpc_args &a, json &, rpc_reply &, cap_error *err) {
  int port = 0;
  return a.get_int("port_id", &port, err) && svc.select_input(port, err);
}

static bool h_is_plugged(capture_service &svc, const rpc_args &a, json &result, rpc_reply &, cap_error *err) {
  int port = 0;
  bool plugged = false;
  if (!a.get_int("port_id", &port, err) || !svc.is_plugged(port, &plugged, err)) return false;
  result = plugged;
  return true;
}

static bool h_plug(capture_service &svc, const rpc_args &a, json &, rpc_reply &, cap_error *err) {
  int port = 0;
  return a.get_int("port_id", &port, err) && svc.plug(port, err);
}

static bool h_unplug(capture_service &svc, const rpc_args &a, json &, rpc_reply &, cap_error *err) {
  int port = 0;
  return a.get_int("port_id", &port, err) && svc.unplug(port, err);
}

static bool h_is_physical_plugged(capture_service &svc, const rpc_args &a, json &result, rpc_reply &,
                                  cap_error *err) {
  int port = 0;
  bool plugged = false;
  if (!a.get_int("port_id", &port, err) || !svc.is_physical_plugged(port, &plugged, err)) return false;
  result = plugged;
  return true;
}

static bool h_fire_hpd_pulse(capture_service &svc, const rpc_args &a, json &, rpc_reply &, cap_error *err) {
  int port = 0, repeat = 1, end_level = 1;
  uint32_t deassert_us = 0, assert_us = 0;
  if (!a.get_int("port_id", &port, err) || !a.get_u32("deassert_interval_usec", &deassert_us, err)) return false;
  if (a.has("assert_interval_usec")) {
    if (!a.get_u32("assert_interval_usec", &assert_us, err)) return false;
  } else {
    assert_us = deassert_us;
  }
  if (!a.opt_int("repeat_count", 1, &repeat, err) || !a.opt_int("end_level", 1, &end_level, err)) return false;
  return svc.fire_hpd_pulse(port, deassert_us, assert_us, repeat, end_level, err);
}

static bool h_fire_mixed_hpd_pulses(capture_service &svc, const rpc_args &a, json &, rpc_reply &, cap_error *err) {
  int port = 0;
  std::vector<uint32_t> widths;
  if (!a.get_int("port_id", &port, err) || !a.get_u32_list("widths_msec", &widths, err)) return false;
  return svc.fire_mixed_hpd_pulses(port, widths, err);
}

static bool h_wait_stable(capture_service &svc, const rpc_args &a, json &result, rpc_reply &, cap_error *err) {
  int port = 0, timeout_sec = 0;
  bool stable = false;
  if (!a.get_int("port_id", &port, err) || !a.opt_int("timeout", 0, &timeout_sec, err)) return false;
  if (timeout_sec < 0) return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "negative timeout");
  if (!svc.wait_video_input_stable(port, (uint32_t)timeout_sec * 1000, &stable, err)) return false;
  result = stable;
  return true;
}

static bool h_detect_resolution(capture_service &svc, const rpc_args &a, json &result, rpc_reply &,
                                cap_error *err) {
  int port = 0;
  uint32_t w = 0, h = 0;
  if (!a.get_int("port_id", &port, err) || !svc.detect_resolution(port, &w, &h, err)) return false;
  result = json::array({w, h});
  return true;
}

static bool h_set_vga_mode(capture_service &svc, const rpc_args &a, json &, rpc_reply &, cap_error *err) {
  int port = 0;
  std::string mode;
  return a.get_int("port_id", &port, err) && a.get_str("mode", &mode, err) && svc.set_vga_mode(port, mode, err);
}

static bool h_max_frame_limit(capture_service &svc, const rpc_args &a, json &result, rpc_reply &,
                              cap_error *err) {
  int port = 0;
  uint32_t w = 0, h = 0, limit = 0;
  if (!a.get_int("port_id", &port, err) || !a.get_u32("width", &w, err) || !a.get_u32("height", &h, err))
    return false;
  if (!svc.get_max_frame_limit(port, w, h, &limit, err)) return false;
  result = limit;
  return true;
}

static bool h_capture_video(capture_service &svc, const rpc_args &a, json &, rpc_reply &, cap_error *err) {
  int port = 0;
  uint32_t total = 0;
  capture_area area;
  if (!a.get_int("port_id", &port, err) || !a.get_u32("total_frame", &total, err) || !a.area(&area, err))
    return false;
  return svc.capture_video(port, total, area, err);
}

static bool h_start_capturing(capture_service &svc, const rpc_args &a, json &, rpc_reply &, cap_error *err) {
  int port = 0;
  capture_area area;
  if (!a.get_int("port_id", &port, err) || !a.area(&area, err)) return false;
  return svc.start_capturing_video(port, area, err);
}

static bool h_stop_capturing(capture_service &svc, const rpc_args &a, json &, rpc_reply &, cap_error *err) {
  int stop_index = 0;
  if (!a.opt_int("stop_index", 0, &stop_index, err)) return false;
  if (stop_index < 0) return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "negative stop_index");
  return svc.stop_capturing_video((uint32_t)stop_index, err);
}

static bool h_frame_count(capture_service &svc, const rpc_args &, json &result, rpc_reply &, cap_error *err) {
  int count = 0;
  if (!svc.get_captured_frame_count(&count, err)) return false;
  result = count;
  return true;
}

static bool h_captured_resolution(capture_service &svc, const rpc_args &, json &result, rpc_reply &,
                                  cap_error *err) {
  uint32_t w = 0, h = 0;
  if (!svc.get_captured_resolution(&w, &h, err)) return false;
  result = json::array({w, h});
  return true;
}

static bool h_read_frame(capture_service &svc, const rpc_args &a, json &, rpc_reply &out, cap_error *err) {
  int index = 0;
  std::vector<uint8_t> data;
  if (!a.get_int("frame_index", &index, err) || !svc.read_captured_frame(index, &data, err)) return false;
  set_binary(out, data);
  return true;
}

static bool h_checksums(capture_service &svc, const rpc_args &a, json &result, rpc_reply &, cap_error *err) {
  int start = 0, stop = -1;
  std::vector<field_hash> hashes;
  if (!a.opt_int("start_index", 0, &start, err) || !a.opt_int("stop_index", -1, &stop, err)) return false;
  if (!svc.get_captured_checksums(start, stop, &hashes, err)) return false;
  result = json::array();
  for (const auto &h : hashes) result.push_back(hash_json(h));
  return true;
}

static bool h_histograms(capture_service &svc, const rpc_args &a, json &result, rpc_reply &, cap_error *err) {
  int start = 0, stop = -1;
  std::vector<std::vector<float>> hists;
  if (!a.opt_int("start_index", 0, &start, err) || !a.opt_int("stop_index", -1, &stop, err)) return false;
  if (!svc.get_captured_histograms(start, stop, &hists, err)) return false;
  result = hists;
  return true;
}

static bool h_pixel_checksum(capture_service &svc, const rpc_args &a, json &result, rpc_reply &, cap_error *err) {
  int port = 0;
  capture_area area;
  field_hash h;
  if (!a.get_int("port_id", &port, err) || !a.area(&area, err)) return false;
  if (!svc.compute_pixel_checksum(port, area, &h, err)) return false;
  result = hash_json(h);
  return true;
}

static bool h_dump_pixels(capture_service &svc, const rpc_args &a, json &, rpc_reply &out, cap_error *err) {
  int port = 0;
  capture_area area;
  std::vector<uint8_t> data;
  if (!a.get_int("port_id", &port, err) || !a.area(&area, err)) return false;
  if (!svc.dump_pixels(port, area, &data, err)) return false;
  set_binary(out, data);
  return true;
}

static bool h_cache_thumbnail(capture_service &svc, const rpc_args &a, json &result, rpc_reply &, cap_error *err) {
  int index = 0, ratio = 2, id = 0;
  if (!a.get_int("frame_index", &index, err) || !a.opt_int("ratio", 2, &ratio, err)) return false;
  if (!svc.cache_frame_thumbnail(index, ratio, &id, err)) return false;
  result = id;
  return true;
}

static bool h_start_audio(capture_service &svc, const rpc_args &a, json &, rpc_reply &, cap_error *err) {
  int port = 0;
  bool has_file = false;
  if (!a.get_int("port_id", &port, err) || !a.opt_bool("has_file", false, &has_file, err)) return false;
  return svc.start_capturing_audio(port, has_file, err);
}

static bool h_stop_audio(capture_service &svc, const rpc_args &a, json &result, rpc_reply &, cap_error *err) {
  int port = 0;
  std::string path;
  audio_data_format fmt;
  if (!a.get_int("port_id", &port, err) || !svc.stop_capturing_audio(port, &path, &fmt, err)) return false;
  json f;
  f["file_type"] = fmt.file_type;
  f["sample_format"] = fmt.sample_format;
  f["channel"] = fmt.channel;
  f["rate"] = fmt.rate;
  result = json::object();
  result["path"] = path.empty() ? json() : json(path);
  result["format"] = f;
  return true;
}

static const std::map<std::string, rpc_handler> &handlers() {
  static const std::map<std::string, rpc_handler> m = {
    {"GetSupportedInputs", h_supported_inputs},
    {"GetConnectorType", h_connector_type},
    {"HasAudioSupport", h_has_audio},
    {"SelectInput", h_select_input},
    {"IsPlugged", h_is_plugged},
    {"Plug", h_plug},
    {"Unplug", h_unplug},
    {"IsPhysicalPlugged", h_is_physical_plugged},
    {"FireHpdPulse", h_fire_hpd_pulse},
    {"FireMixedHpdPulses", h_fire_mixed_hpd_pulses},
    {"WaitVideoInputStable", h_wait_stable},
    {"DetectResolution", h_detect_resolution},
    {"SetVgaMode", h_set_vga_mode},
    {"GetMaxFrameLimit", h_max_frame_limit},
    {"DumpFramesToLimit", h_capture_video},
    {"CaptureVideo", h_capture_video},
    {"StartDumpingFrames", h_start_capturing},
    {"StartCapturingVideo", h_start_capturing},
    {"StopDumpingFrames", h_stop_capturing},
    {"StopCapturingVideo", h_stop_capturing},
    {"GetDumpedFrameCount", h_frame_count},
    {"GetCapturedFrameCount", h_frame_count},
    {"GetCapturedResolution", h_captured_resolution},
    {"ReadCapturedFrame", h_read_frame},
    {"GetFrameHashes", h_checksums},
    {"GetCapturedChecksums", h_checksums},
    {"GetHistograms", h_histograms},
    {"GetCapturedHistograms", h_histograms},
    {"ComputePixelChecksum", h_pixel_checksum},
    {"DumpPixels", h_dump_pixels},
    {"CacheFrameThumbnail", h_cache_thumbnail},
    {"StartCapturingAudio", h_start_audio},
    {"StopCapturingAudio", h_stop_audio},
  };
  return m;
}

std::vector<std::string> rpc_method_names() {
  std::vector<std::string> names;
  for (const auto &kv : handlers()) names.push_back(kv.first);
  return names;
}

void rpc_dispatch(capture_service &svc, const std::string &method, const std::string &body, rpc_reply &out) {
  out = rpc_reply();
  auto it = handlers().find(method);
  if (it == handlers().end()) {
    set_error(out, 404, "NOT_FOUND", "unknown method " + method);
    return;
  }
  json j = body.empty() ? json::object() : json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    set_error(out, 400, cap_err_kind_name(cap_err_kind::INVALID_ARGUMENT), "invalid json body");
    return;
  }

  rpc_args args(j);
  json result;
  cap_error err;
  if (!it->second(svc, args, result, out, &err)) {
    fprintf(stderr, "[rpc] %s failed: %s: %s\n", method.c_str(), cap_err_kind_name(err.kind), err.msg.c_str());
    set_error(out, err);
    return;
  }
  if (out.content_type == "application/json") {
    json o;
    o["result"] = result;
    out.body = reply_dump(o);
  }
}

static bool slurp_binary(const std::string &path, std::string &out) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  std::stringstream ss;
  ss << f.rdbuf();
  out = ss.str();
  return true;
}

void rpc_start_detached(int port) {
  std::thread([port]() {
    httplib::Server svr;

    svr.Post(R"(/rpc/(\w+))", [](const httplib::Request &req, httplib::Response &res) {
      rpc_reply out;
      rpc_call(req.matches[1], req.body, out);
      res.status = out.http_status;
      res.set_content(out.body, out.content_type.c_str());
    });

    svr.Get(R"(/api/thumbnail/(\d+))", [](const httplib::Request &req, httplib::Response &res) {
      std::string path;
      {
        std::lock_guard<std::mutex> call(g_call_mtx);
        capture_service *svc = current_service();
        if (!svc) {
          res.status = 500;
          res.set_content("{\"error\":\"no capture service\"}", "application/json");
          return;
        }
        path = svc->thumbnail_path((int)strtol(req.matches[1].str().c_str(), nullptr, 10));
      }
      std::string data;
      if (!slurp_binary(path, data)) {
        res.status = 404;
        res.set_content("{\"error\":\"no such thumbnail\"}", "application/json");
        return;
      }
      res.set_content(data, "image/jpeg");
    });

    svr.Get("/api/methods", [](const httplib::Request&, httplib::Response &res) {
      json j = rpc_method_names();
      res.set_content(j.dump(), "application/json");
    });

    svr.Get("/api/config", [](const httplib::Request&, httplib::Response &res) {
      std::string (*cfgp)() = nullptr;
      {
        std::lock_guard<std::mutex> lk(g_mtx);
        cfgp = g_cfg_json;
      }
      if (!cfgp) {
        res.status = 500;
        res.set_content("{\"error\":\"no config provider\"}", "application/json");
        return;
      }
      res.set_content(cfgp(), "application/json");
    });

    svr.Get("/api/status", [](const httplib::Request&, httplib::Response &res) {
      std::string (*st)() = nullptr;
      {
        std::lock_guard<std::mutex> lk(g_mtx);
        st = g_status;
      }
      if (!st) {
        res.status = 500;
        res.set_content("{\"error\":\"no status provider\"}", "application/json");
        return;
      }
      std::lock_guard<std::mutex> call(g_call_mtx);
      res.set_content(st(), "application/json");
    });

    svr.Post("/api/quit", [](const httplib::Request&, httplib::Response &res) {
      std::atomic<bool> *q = nullptr;
      {
        std::lock_guard<std::mutex> lk(g_mtx);
        q = g_quit;
      }
      if (q) q->store(true);
      res.set_content("{\"ok\":true}", "application/json");
    });

    std::string addr;
    {
      std::lock_guard<std::mutex> lk(g_mtx);
      addr = g_listen_addr;
    }
    fprintf(stderr, "[rpc] listening on %s:%d\n", addr.c_str(), port);
    if (!svr.listen(addr.c_str(), port))
      fprintf(stderr, "[rpc] listen on %s:%d failed\n", addr.c_str(), port);
  }).detach();
}
