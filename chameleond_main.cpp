#include <errno.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <atomic>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "audio_capture.h"
#include "audio_dumper.h"
#include "capture_service.h"
#include "chameleond_config.h"
#include "chameleond_rpc.h"
#include "fpga_mem.h"
#include "hpd_control.h"
#include "input_flow.h"
#include "io_expander.h"
#include "linux_i2c.h"
#include "pixel_tools.h"
#include "rx.h"
#include "video_dumper.h"
#include "wait_util.h"

using nlohmann::json;

// -------------------- Helpers --------------------
static std::string slurp_file(const std::string &path) {
  std::ifstream f(path);
  if (!f.is_open()) return {};
  std::stringstream ss;
  ss << f.rdbuf();
  return ss.str();
}
static bool write_file_atomic(const std::string &path, const std::string &data) {
  std::string tmp = path + ".tmp";
  {
    std::ofstream f(tmp, std::ios::trunc);
    if (!f.is_open()) return false;
    f << data;
    f.flush();
    if (!f.good()) return false;
  }
  if (rename(tmp.c_str(), path.c_str()) != 0) return false;
  return true;
}
static bool parse_i2c_bus_num(const std::string &dev, int *num) {
  size_t pos = dev.rfind('-');
  if (pos == std::string::npos || pos + 1 >= dev.size()) return false;
  char *end = nullptr;
  long v = strtol(dev.c_str() + pos + 1, &end, 10);
  if (*end != '\0' || v < 0) return false;
  *num = (int)v;
  return true;
}

// ---------------- Board ----------------
// All hardware objects of the board plus the service built on top of them.
struct board {
  std::unique_ptr<devmem_region> controller;
  std::unique_ptr<i2c_bus> bus;
  std::vector<std::unique_ptr<i2c_slave>> slaves;
  std::unique_ptr<power_io> power;
  std::unique_ptr<mux_io> mux;
  std::unique_ptr<video_dumper> dumper_a, dumper_b;
  std::unique_ptr<hpd_control> hpd;
  std::unique_ptr<audio_dumper> adump;
  std::unique_ptr<subprocess_pixel_dump> pixdump;
  std::unique_ptr<subprocess_histogram> hist;
  std::vector<std::unique_ptr<input_flow>> flows;
  std::unique_ptr<audio_capture_manager> audio;
  std::unique_ptr<capture_service> service;

  i2c_slave *slave(uint8_t addr) {
    slaves.emplace_back(new i2c_slave(bus.get(), addr));
    return slaves.back().get();
  }

  bool init_from_config(const persisted_config &c);
  void shutdown();
};

bool board::init_from_config(const persisted_config &c) {
  std::string err;
  controller.reset(new devmem_region(devmem_region::kControllerBase, devmem_region::kControllerSize));
  if (!controller->open("/dev/mem", &err)) {
    fprintf(stderr, "[board] %s\n", err.c_str());
    return false;
  }
  int bus_num = 0;
  if (!parse_i2c_bus_num(c.i2c_bus, &bus_num)) {
    fprintf(stderr, "[board] bad i2cBus '%s'\n", c.i2c_bus.c_str());
    return false;
  }
  bus.reset(new i2c_bus(bus_num));
  if (!bus->open(&err)) {
    fprintf(stderr, "[board] %s\n", err.c_str());
    return false;
  }

  cap_error cerr;
  power.reset(new power_io(slave(power_io::kSlaveAddress)));
  mux.reset(new mux_io(slave(mux_io::kSlaveAddress)));
  if (!power->initialize(&cerr) || !mux->initialize(&cerr)) {
    fprintf(stderr, "[board] io expander init failed: %s\n", cerr.msg.c_str());
    return false;
  }

  dumper_a.reset(new video_dumper(controller.get(), 0));
  dumper_b.reset(new video_dumper(controller.get(), 1));
  hpd.reset(new hpd_control(controller.get()));
  adump.reset(new audio_dumper(controller.get()));
  pixdump.reset(new subprocess_pixel_dump(c.pixeldump_path));
  hist.reset(new subprocess_histogram(c.histogram_path));

  capture_service_options so;
  so.max_captured_frames = c.max_captured_frames;
  so.frame_dump_timeout_ms = c.frame_dump_timeout_sec * 1000;
  so.thumbnail_dir = c.thumbnail_dir;
  so.audio_dump_dir = c.audio_dump_dir;
  so.thumbnail_quality = c.thumbnail_quality;
  service.reset(new capture_service(so));
  audio.reset(new audio_capture_manager(adump.get(), pixdump.get()));
  service->set_audio(audio.get());

  input_flow_options fo;
  fo.fields.strict_dual_paths = c.strict_dual_paths;
  for (int id = CONN_DP1; id <= CONN_VGA; id++) {
    std::unique_ptr<rx_chip> rx;
    switch (id) {
      case CONN_DP1: rx.reset(new dp_rx(slave(dp_rx::kSlaveAddresses[0]))); break;
      case CONN_DP2: rx.reset(new dp_rx(slave(dp_rx::kSlaveAddresses[1]))); break;
      case CONN_HDMI: rx.reset(new hdmi_rx(slave(hdmi_rx::kSlaveAddress))); break;
      default: rx.reset(new vga_rx(slave(vga_rx::kSlaveAddress))); break;
    }
    fo.hysteresis = (id == CONN_HDMI) ? c.hdmi_hysteresis : c.dp_hysteresis;
    flows.emplace_back(new input_flow((connector_id)id, std::move(rx), hpd.get(), power.get(), mux.get(),
                                      dumper_a.get(), dumper_b.get(), pixdump.get(), hist.get(), fo));
    input_flow *flow = flows.back().get();
    // A receiver that fails here is reported by later calls on that port.
    if (!flow->initialize(&cerr))
      fprintf(stderr, "[board] input #%d init failed: %s\n", id, cerr.msg.c_str());
    if (id == CONN_VGA && !flow->set_vga_mode(c.vga_mode, &cerr))
      fprintf(stderr, "[board] vgaMode '%s' rejected: %s\n", c.vga_mode.c_str(), cerr.msg.c_str());
    service->add_flow(flow);
  }
  return true;
}

void board::shutdown() {
  if (audio && audio->is_capturing()) {
    audio_data_format fmt;
    cap_error err;
    if (!audio->stop(&fmt, &err)) fprintf(stderr, "[board] audio stop: %s\n", err.msg.c_str());
  }
  for (auto &f : flows) {
    if (!f->fields()->is_monitoring()) continue;
    cap_error err;
    if (!f->frames()->stop_dumping_frames(&err)) fprintf(stderr, "[board] capture stop: %s\n", err.msg.c_str());
  }
  service.reset();
  audio.reset();
  flows.clear();
  hist.reset();
  pixdump.reset();
  adump.reset();
  hpd.reset();
  dumper_b.reset();
  dumper_a.reset();
  mux.reset();
  power.reset();
  slaves.clear();
  bus.reset();
  controller.reset();
}

// ---------------- Global state ----------------
static std::mutex g_cfg_mtx;
static persisted_config g_cfg;
static std::string g_cfg_path = "./chameleond_config.json";
static std::atomic<bool> g_quit{false};
static board g_board;

static persisted_config cfg_snapshot() {
  std::lock_guard<std::mutex> lk(g_cfg_mtx);
  persisted_config c = g_cfg;
  cfg_normalize(c);
  return c;
}
static bool save_config_locked() {
  std::string j = config_to_json(g_cfg);
  return write_file_atomic(g_cfg_path, j);
}

static std::string config_json_provider() {
  std::lock_guard<std::mutex> lk(g_cfg_mtx);
  return config_to_json(g_cfg);
}

// Called with the RPC call mutex held.
static std::string status_json() {
  json j;
  j["ok"] = true;
  capture_service *svc = g_board.service.get();
  if (!svc) {
    j["board"] = "down";
    return j.dump();
  }
  j["board"] = "up";
  j["selectedInput"] = svc->selected_input();
  if (svc->has_capture()) {
    j["capturedPort"] = svc->captured_port();
    j["maxFrameLimit"] = svc->captured_max_frame_limit();
  }
  json inputs = json::array();
  for (auto &f : g_board.flows) {
    json o;
    o["id"] = (int)f->id();
    o["type"] = f->connector_type();
    o["dual"] = f->is_dual();
    if (f->fsm()) {
      o["fsm"] = link_fsm_state_name(f->fsm()->current());
      o["lastPclkMhz"] = f->fsm()->state().last_pclk_mhz;
    }
    o["capturing"] = f->fields()->is_monitoring();
    o["fieldCount"] = f->fields()->field_count();
    inputs.push_back(o);
  }
  j["inputs"] = inputs;
  j["audioCapturing"] = g_board.audio && g_board.audio->is_capturing();
  return j.dump();
}

static void on_signal(int) { g_quit.store(true); }

// ---------------- Main ----------------
static void usage(const char *argv0) {
  fprintf(stderr,
    "Usage: %s [--config PATH] [--rpc-port N] [--listen ADDR] [--i2c-bus /dev/i2c-N]\n"
    "          [--strict-dual-paths] [--pixeldump PATH] [--histogram PATH]\n"
    "          [--audio-dir DIR] [--thumbnail-dir DIR] [--vga-mode auto|NAME]\n",
    argv0
  );
}

int main(int argc, char **argv) {
  for (int i=1;i<argc;i++) {
    if (strcmp(argv[i],"--config")==0 && i+1<argc) g_cfg_path=argv[++i];
  }

  // load config
  {
    persisted_config loaded;
    std::string txt = slurp_file(g_cfg_path);
    if (!txt.empty()) {
      if (config_from_json_text(txt, loaded)) fprintf(stderr, "[config] loaded %s\n", g_cfg_path.c_str());
      else fprintf(stderr, "[config] config parse failed; using defaults\n");
    } else {
      fprintf(stderr, "[config] no config found; using defaults\n");
    }
    cfg_normalize(loaded);
    std::lock_guard<std::mutex> lk(g_cfg_mtx);
    g_cfg = loaded;
  }

  // CLI overrides
  for (int i=1;i<argc;i++) {
    if (strcmp(argv[i],"--config")==0) { i++; continue; }
    if (strcmp(argv[i],"-h")==0 || strcmp(argv[i],"--help")==0) { usage(argv[0]); return 0; }

    std::lock_guard<std::mutex> lk(g_cfg_mtx);
    if (strcmp(argv[i],"--rpc-port")==0 && i+1<argc) g_cfg.rpc_port=atoi(argv[++i]);
    else if (strcmp(argv[i],"--listen")==0 && i+1<argc) g_cfg.listen_addr=argv[++i];
    else if (strcmp(argv[i],"--i2c-bus")==0 && i+1<argc) g_cfg.i2c_bus=argv[++i];
    else if (strcmp(argv[i],"--strict-dual-paths")==0) g_cfg.strict_dual_paths=true;
    else if (strcmp(argv[i],"--pixeldump")==0 && i+1<argc) g_cfg.pixeldump_path=argv[++i];
    else if (strcmp(argv[i],"--histogram")==0 && i+1<argc) g_cfg.histogram_path=argv[++i];
    else if (strcmp(argv[i],"--audio-dir")==0 && i+1<argc) g_cfg.audio_dump_dir=argv[++i];
    else if (strcmp(argv[i],"--thumbnail-dir")==0 && i+1<argc) g_cfg.thumbnail_dir=argv[++i];
    else if (strcmp(argv[i],"--vga-mode")==0 && i+1<argc) g_cfg.vga_mode=argv[++i];
    else {
      fprintf(stderr, "Unknown argument '%s'\n", argv[i]);
      usage(argv[0]);
      return 1;
    }
  }

  {
    std::lock_guard<std::mutex> lk(g_cfg_mtx);
    cfg_normalize(g_cfg);
    if (!save_config_locked()) fprintf(stderr, "[config] could not save %s\n", g_cfg_path.c_str());
  }

  signal(SIGINT, on_signal);
  signal(SIGTERM, on_signal);

  while (!g_quit.load()) {
    auto snap = cfg_snapshot();
    if (g_board.init_from_config(snap)) break;
    fprintf(stderr, "[supervisor] board init failed; retrying in 1s...\n");
    g_board.shutdown();
    sleep_ms(1000);
  }
  if (g_quit.load()) {
    g_board.shutdown();
    return 0;
  }

  auto snap = cfg_snapshot();
  rpc_set_service(g_board.service.get());
  rpc_set_config_json_provider(&config_json_provider);
  rpc_set_status_provider(&status_json);
  rpc_set_quit_flag(&g_quit);
  rpc_set_listen_address(snap.listen_addr);
  rpc_start_detached(snap.rpc_port);

  while (!g_quit.load()) sleep_ms(200);

  fprintf(stderr, "[main] shutting down...\n");
  rpc_exclusive([]() {
    rpc_set_service(nullptr);
    g_board.shutdown();
  });
  return 0;
}
