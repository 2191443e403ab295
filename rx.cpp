#include "rx.h"

#include <cstdio>

#include "wait_util.h"

bool rx_chip::wait_video_input_stable(uint32_t timeout_ms, bool *stable, cap_error *err) {
  cap_error werr;
  bool ok = wait_for_condition([this](bool *met, cap_error *e) {
    return is_video_input_stable(met, e);
  }, stable_probe_ms(), timeout_ms, "video input stable", &werr);
  if (ok) {
    *stable = true;
    return true;
  }
  if (werr.kind == cap_err_kind::TIMEOUT) {
    *stable = false;
    return true;
  }
  if (err) *err = werr;
  return false;
}

static bool dump_256(reg_bus *bus, std::vector<uint8_t> *out, cap_error *err) {
  return bus->get_block(0, 256, out, err);
}

// ---------------- DisplayPort: IT6506 ----------------
const uint8_t dp_rx::kSlaveAddresses[2] = {0x58, 0x59};

static const uint8_t DP_REG_PCLK_COUNT_LOW = 0x10;
static const uint8_t DP_REG_PCLK_COUNT_HIGH = 0x11;
static const uint8_t DP_REG_INPUT_STATUS = 0x11;
static const uint8_t DP_BIT_VIDEO_STABLE = 1 << 4;
static const uint8_t DP_BIT_AUDIO_STABLE = 1 << 5;
static const uint8_t DP_REG_FUNC_RESET = 0xea;
static const uint8_t DP_BIT_RESET_AUDIO = 1 << 2;
static const uint8_t DP_REG_HACTIVE_H = 0x9c;
static const uint8_t DP_REG_HACTIVE_L = 0x9b;
static const uint8_t DP_REG_VACTIVE_H = 0xa2;
static const uint8_t DP_REG_VACTIVE_L = 0xa1;
static const uint8_t DP_REG_VIDEO_FLAG = 0xa9;
static const uint8_t DP_BIT_INTERLACED = 1 << 2;
static const uint8_t DP_REG_CABLE_STATUS = 0xc8;
static const uint8_t DP_BIT_CABLE_POWERED = 1 << 3;
static const uint8_t DP_REG_BANK = 0x05;

bool dp_rx::switch_bank(int bank, cap_error *err) {
  return bus_->set_byte(DP_REG_BANK, (uint8_t)(0x02 + bank), err);
}

// {reg, value} pairs; reg 0xff switches bank to value.
bool dp_rx::write_seq(const uint8_t (*seq)[2], size_t n, cap_error *err) {
  for (size_t i = 0; i < n; i++) {
    if (seq[i][0] == 0xff) {
      if (!switch_bank(seq[i][1], err)) return false;
    } else if (!bus_->set_byte(seq[i][0], seq[i][1], err)) {
      return false;
    }
  }
  return true;
}

bool dp_rx::set_pixel_mode(bool dual, cap_error *err) {
  static const uint8_t dual_seq[][2] = {
    {0xff, 0},
    {0xed, 0x6c},   // power up dual pixel path
    {0xef, 0x06},   // dual pixel timing
    {0xff, 1},
    {0xa2, 0x11},   // bit 0 resets the FIFO
    {0xa2, 0x10},   // bit 4 enables dual pixel mode
    {0xff, 0},
  };
  static const uint8_t single_seq[][2] = {
    {0xff, 0},
    {0xed, 0xec},   // power down dual pixel path
    {0xef, 0x07},   // single pixel timing
    {0xff, 1},
    {0xa2, 0x00},
    {0xff, 0},
  };
  if (dual) return write_seq(dual_seq, sizeof(dual_seq) / sizeof(dual_seq[0]), err);
  return write_seq(single_seq, sizeof(single_seq) / sizeof(single_seq[0]), err);
}

bool dp_rx::initialize(bool dual, cap_error *err) {
  fprintf(stderr, "[rx] initialize DisplayPort receiver (%s pixel)\n", dual ? "dual" : "single");
  static const uint8_t init_seq[][2] = {
    {0xff, 0},
    {0xe3, 0x01},   // interrupt output active low
    {0xd2, 0xe0},
    {0xcc, 0xc5},
    {0xff, 1},
    {0xa5, 0xee},   // video driving strength
    {0xb8, 0x03},
    {0xa6, 0xee},   // max audio driving strength
    {0xb3, 0x04},   // reset audio pll
    {0xff, 0},
    {0xea, 0x04},   // reset audio module
  };
  static const uint8_t release_seq[][2] = {
    {0xff, 1},
    {0xb3, 0x00},
    {0xff, 0},
    {0xea, 0x00},
  };
  if (!set_pixel_mode(dual, err)) return false;
  if (!write_seq(init_seq, sizeof(init_seq) / sizeof(init_seq[0]), err)) return false;
  sleep_ms(1);
  return write_seq(release_seq, sizeof(release_seq) / sizeof(release_seq[0]), err);
}

bool dp_rx::is_video_input_stable(bool *stable, cap_error *err) {
  uint8_t v = 0;
  if (!bus_->get(DP_REG_INPUT_STATUS, &v, err)) return false;
  *stable = (v & DP_BIT_VIDEO_STABLE) != 0;
  return true;
}

bool dp_rx::pixel_clock_mhz(double *mhz, cap_error *err) {
  uint8_t lo = 0, hi = 0;
  if (!bus_->get(DP_REG_PCLK_COUNT_LOW, &lo, err)) return false;
  if (!bus_->get(DP_REG_PCLK_COUNT_HIGH, &hi, err)) return false;
  uint32_t count = lo + ((uint32_t)(hi & 0x0f) << 8);
  *mhz = count ? 27.0 * 1024.0 / count : 0.0;
  return true;
}

bool dp_rx::is_interlaced(bool *interlaced, cap_error *err) {
  uint8_t v = 0;
  if (!bus_->get(DP_REG_VIDEO_FLAG, &v, err)) return false;
  *interlaced = (v & DP_BIT_INTERLACED) != 0;
  return true;
}

bool dp_rx::frame_resolution(uint32_t *w, uint32_t *h, cap_error *err) {
  uint8_t hh = 0, hl = 0, vh = 0, vl = 0;
  bool interlaced = false;
  if (!bus_->get(DP_REG_HACTIVE_H, &hh, err) || !bus_->get(DP_REG_HACTIVE_L, &hl, err) ||
      !bus_->get(DP_REG_VACTIVE_H, &vh, err) || !bus_->get(DP_REG_VACTIVE_L, &vl, err))
    return false;
  if (!is_interlaced(&interlaced, err)) return false;
  *w = (uint32_t)hh << 8 | hl;
  *h = ((uint32_t)vh << 8 | vl) * (interlaced ? 2 : 1);
  return true;
}

bool dp_rx::is_cable_powered(bool *powered, cap_error *err) {
  uint8_t v = 0;
  if (!bus_->get(DP_REG_CABLE_STATUS, &v, err)) return false;
  *powered = (v & DP_BIT_CABLE_POWERED) != 0;
  return true;
}

bool dp_rx::reset_audio_logic(cap_error *err) {
  uint8_t v = 0;
  if (!bus_->get(DP_REG_INPUT_STATUS, &v, err)) return false;
  if (v & DP_BIT_AUDIO_STABLE) return true;
  fprintf(stderr, "[rx] reset DisplayPort audio logic\n");
  return bus_->set_and_clear(DP_REG_FUNC_RESET, DP_BIT_RESET_AUDIO, 1, err);
}

bool dp_rx::dump_registers(std::vector<uint8_t> *out, cap_error *err) {
  return dump_256(bus_, out, err);
}

// ---------------- HDMI: IT6803 ----------------
static const uint8_t HDMI_REG_P0_INTERRUPT = 0x05;
static const uint8_t HDMI_BIT_RX_CLK_STABLE_CHG = 1 << 2;
static const uint8_t HDMI_BIT_RX_CLK_ON_CHG = 1 << 1;
static const uint8_t HDMI_REG_INTERNAL_STATUS = 0x0a;
static const uint8_t HDMI_BIT_PWR5V_DET = 1 << 0;
static const uint8_t HDMI_REG_AUDIO_VIDEO_RESET = 0x10;
static const uint8_t HDMI_BIT_AUDIO_RESET = 1 << 1;
static const uint8_t HDMI_REG_P0_RESET = 0x11;
static const uint8_t HDMI_BIT_P0_SWRST = 1 << 0;
static const uint8_t HDMI_REG_VIDEO_MODE = 0x99;
static const uint8_t HDMI_BIT_VIDEO_STABLE = 1 << 3;
static const uint8_t HDMI_BIT_INTERLACED = 1 << 1;
static const uint8_t HDMI_REG_PIXEL_CLOCK_DIV = 0x9a;
static const uint8_t HDMI_REG_CLK_CONFIG = 0x54;
static const uint8_t HDMI_MASK_RCLK_SELECT = 0x03;
static const uint8_t HDMI_REG_HACTIVE_H = 0x9f;
static const uint8_t HDMI_REG_HACTIVE_L = 0x9e;
static const uint8_t HDMI_REG_VACTIVE_H = 0xa4;
static const uint8_t HDMI_REG_VACTIVE_L = 0xa5;
static const uint32_t HDMI_SOFTWARE_RESET_MS = 300;

static bool write_pairs(reg_bus *bus, const uint8_t (*seq)[2], size_t n, cap_error *err) {
  for (size_t i = 0; i < n; i++)
    if (!bus->set_byte(seq[i][0], seq[i][1], err)) return false;
  return true;
}

bool hdmi_rx::set_pixel_mode(bool dual, cap_error *err) {
  static const uint8_t dual_seq[][2] = {
    {0x05, 0x02},   // bank 0
    {0x0d, 0x0f},   // enable PHFCLK
    {0x8b, 0x03},   // dual pixel mode
    {0x8c, 0x08},   // QA IO
    {0x8b, 0x01},   // dual pixel fifo normal operation
    {0x50, 0xb1},   // dual pixel timing
  };
  static const uint8_t single_seq[][2] = {
    {0x0d, 0x07},   // disable PHFCLK
    {0x8b, 0x80},
    {0x8c, 0x09},   // QA IO, single pixel mode 1
    {0x50, 0xb3},   // single pixel timing
  };
  if (dual) return write_pairs(bus_, dual_seq, sizeof(dual_seq) / sizeof(dual_seq[0]), err);
  return write_pairs(bus_, single_seq, sizeof(single_seq) / sizeof(single_seq[0]), err);
}

bool hdmi_rx::load_pclk_base(cap_error *err) {
  uint8_t v = 0;
  if (!bus_->get(HDMI_REG_CLK_CONFIG, &v, err)) return false;
  double rclk = 43.3 / (double)(1 << ((v & HDMI_MASK_RCLK_SELECT) + 1));
  pclk_base_ = rclk * 255.0;
  return true;
}

bool hdmi_rx::initialize(bool dual, cap_error *err) {
  fprintf(stderr, "[rx] initialize HDMI receiver (%s pixel)\n", dual ? "dual" : "single");
  static const uint8_t init_seq[][2] = {
    {0x63, 0x3f},   // interrupt IO output
    {0x58, 0x33},   // max video driving strength
    {0x59, 0x33},   // max audio driving strength
  };
  // YUV color space conversion, then port 0 logic reset.
  static const uint8_t csc_seq[][2] = {
    {0x0f, 0x01}, {0x70, 0x04}, {0x71, 0x00}, {0x72, 0xa7}, {0x73, 0x4f},
    {0x74, 0x09}, {0x75, 0xba}, {0x76, 0x3b}, {0x77, 0x4b}, {0x78, 0x3e},
    {0x79, 0x4f}, {0x7a, 0x09}, {0x7b, 0x57}, {0x7c, 0x0e}, {0x7d, 0x02},
    {0x7e, 0x00}, {0x7f, 0x4f}, {0x80, 0x09}, {0x81, 0xfe}, {0x82, 0x3f},
    {0x83, 0xe8}, {0x84, 0x10}, {0x0f, 0x00},
    {0x11, 0x01}, {0x11, 0x00},
  };
  if (!set_pixel_mode(dual, err)) return false;
  if (!write_pairs(bus_, init_seq, sizeof(init_seq) / sizeof(init_seq[0]), err)) return false;
  if (!write_pairs(bus_, csc_seq, sizeof(csc_seq) / sizeof(csc_seq[0]), err)) return false;
  return load_pclk_base(err);
}

bool hdmi_rx::is_video_input_stable(bool *stable, cap_error *err) {
  uint8_t v = 0;
  if (!bus_->get(HDMI_REG_VIDEO_MODE, &v, err)) return false;
  *stable = (v & HDMI_BIT_VIDEO_STABLE) != 0;
  return true;
}

bool hdmi_rx::pixel_clock_mhz(double *mhz, cap_error *err) {
  if (pclk_base_ == 0.0 && !load_pclk_base(err)) return false;
  uint8_t div = 0;
  if (!bus_->get(HDMI_REG_PIXEL_CLOCK_DIV, &div, err)) return false;
  *mhz = div ? pclk_base_ / div : 0.0;
  return true;
}

bool hdmi_rx::is_interlaced(bool *interlaced, cap_error *err) {
  uint8_t v = 0;
  if (!bus_->get(HDMI_REG_VIDEO_MODE, &v, err)) return false;
  *interlaced = (v & HDMI_BIT_INTERLACED) != 0;
  return true;
}

bool hdmi_rx::frame_resolution(uint32_t *w, uint32_t *h, cap_error *err) {
  uint8_t hh = 0, hl = 0, vh = 0, vl = 0;
  bool interlaced = false;
  if (!bus_->get(HDMI_REG_HACTIVE_H, &hh, err) || !bus_->get(HDMI_REG_HACTIVE_L, &hl, err) ||
      !bus_->get(HDMI_REG_VACTIVE_H, &vh, err) || !bus_->get(HDMI_REG_VACTIVE_L, &vl, err))
    return false;
  if (!is_interlaced(&interlaced, err)) return false;
  *w = (uint32_t)(hh & 0x3f) << 8 | hl;
  *h = ((uint32_t)(vh & 0xf0) << 4 | vl) * (interlaced ? 2 : 1);
  return true;
}

bool hdmi_rx::is_cable_powered(bool *powered, cap_error *err) {
  uint8_t v = 0;
  if (!bus_->get(HDMI_REG_INTERNAL_STATUS, &v, err)) return false;
  *powered = (v & HDMI_BIT_PWR5V_DET) != 0;
  return true;
}

// Interrupt bits are write-one-to-clear.
bool hdmi_rx::clear_interrupt(cap_error *err) {
  uint8_t v = 0;
  if (!bus_->get(HDMI_REG_P0_INTERRUPT, &v, err)) return false;
  return bus_->set_byte(HDMI_REG_P0_INTERRUPT, v, err);
}

bool hdmi_rx::is_reset_needed(bool *needed, cap_error *err) {
  uint8_t v = 0;
  if (!bus_->get(HDMI_REG_P0_INTERRUPT, &v, err)) return false;
  if (!clear_interrupt(err)) return false;
  *needed = (v & (HDMI_BIT_RX_CLK_STABLE_CHG | HDMI_BIT_RX_CLK_ON_CHG)) != 0;
  return true;
}

bool hdmi_rx::reset(cap_error *err) {
  fprintf(stderr, "[rx] reset HDMI receiver\n");
  if (!bus_->set_and_clear(HDMI_REG_P0_RESET, HDMI_BIT_P0_SWRST, HDMI_SOFTWARE_RESET_MS, err)) return false;
  return clear_interrupt(err);
}

bool hdmi_rx::reset_audio_logic(cap_error *err) {
  return bus_->set_and_clear(HDMI_REG_AUDIO_VIDEO_RESET, HDMI_BIT_AUDIO_RESET, 1, err);
}

bool hdmi_rx::dump_registers(std::vector<uint8_t> *out, cap_error *err) {
  return dump_256(bus_, out, err);
}

// ---------------- VGA: CAT9883C ----------------
static const uint8_t VGA_REG_SYNC_DETECT = 0x14;
static const uint8_t VGA_BIT_HSYNC_DETECTED = 1 << 7;
static const uint8_t VGA_BIT_TV_MODE = 1 << 6;
static const uint8_t VGA_BIT_VSYNC_DETECTED = 1 << 4;
static const uint8_t VGA_REG_HSYNC_COUNTER_REFRESH = 0x8f;
static const uint8_t VGA_HSYNC_COUNTER_REFRESH = 0x68;
static const uint8_t VGA_REG_HSYNC_COUNTER_H = 0xac;
static const uint8_t VGA_REG_HSYNC_COUNTER_L = 0xab;
static const size_t VGA_MODE_REGS = 19;

struct vga_mode_setting {
  const char *name;
  uint8_t regs[VGA_MODE_REGS];   // registers 0x01..0x13
};

#define VGA_TAIL_A 0xf0, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80
#define VGA_TAIL_B 0xb8, 0x19, 0x00, 0x00

static const vga_mode_setting kVgaModes[] = {
  {"PC_576px50",          {0x35, 0xf0, 0x68, 0x80, 0x20, 0x10, VGA_TAIL_A, 0x40, 0x6f, VGA_TAIL_B}},
  {"PC_480px60",          {0x35, 0x90, 0x28, 0x38, 0x20, 0x10, VGA_TAIL_A, 0x40, 0x6f, VGA_TAIL_B}},
  {"PC_720px60",          {0x67, 0x10, 0xa0, 0x38, 0x40, 0x40, VGA_TAIL_A, 0x44, 0x6f, VGA_TAIL_B}},
  {"PC_1080ix60",         {0x89, 0x70, 0xa0, 0x38, 0x40, 0x40, VGA_TAIL_A, 0x44, 0x6f, VGA_TAIL_B}},
  {"PC_640x480x60",       {0x31, 0xf0, 0x30, 0x88, 0x10, 0x10, VGA_TAIL_A, 0x42, 0x6e, VGA_TAIL_B}},
  {"PC_640x480x72",       {0x33, 0xf0, 0x70, 0x88, 0x10, 0x10, VGA_TAIL_A, 0x42, 0x6e, VGA_TAIL_B}},
  {"PC_640x480x75",       {0x34, 0x70, 0x70, 0x88, 0x10, 0x10, VGA_TAIL_A, 0x42, 0x6e, VGA_TAIL_B}},
  {"PC_640x480x85",       {0x33, 0xf0, 0x70, 0x88, 0x10, 0x10, VGA_TAIL_A, 0x42, 0x6e, VGA_TAIL_B}},
  {"PC_800x600x56",       {0x3f, 0xf0, 0x70, 0x38, 0x10, 0x20, VGA_TAIL_A, 0x42, 0x6e, VGA_TAIL_B}},
  {"PC_800x600x60",       {0x41, 0xf0, 0x60, 0x38, 0x10, 0x20, VGA_TAIL_A, 0x42, 0x6e, VGA_TAIL_B}},
  {"PC_800x600x72",       {0x40, 0xf0, 0x70, 0x38, 0x10, 0x20, VGA_TAIL_A, 0x42, 0x6e, VGA_TAIL_B}},
  {"PC_800x600x75",       {0x41, 0xf0, 0x70, 0x38, 0x10, 0x20, VGA_TAIL_A, 0x42, 0x6e, VGA_TAIL_B}},
  {"PC_800x600x85",       {0x41, 0x70, 0x70, 0x38, 0x10, 0x20, VGA_TAIL_A, 0x42, 0x6e, VGA_TAIL_B}},
  {"PC_1024x768x60",      {0x53, 0xf0, 0xa8, 0x38, 0x10, 0x40, VGA_TAIL_A, 0x42, 0x6e, VGA_TAIL_B}},
  {"PC_1024x768x70",      {0x52, 0xf0, 0xa8, 0x38, 0x10, 0x40, VGA_TAIL_A, 0x42, 0x6e, VGA_TAIL_B}},
  {"PC_1024x768x75",      {0x51, 0xf0, 0xa8, 0x38, 0x10, 0x40, VGA_TAIL_A, 0x42, 0x6e, VGA_TAIL_B}},
  {"PC_1024x768x80",      {0x53, 0x70, 0xa8, 0x38, 0x10, 0x40, VGA_TAIL_A, 0x42, 0x6e, VGA_TAIL_B}},
  {"PC_1024x768x85",      {0x55, 0xf0, 0xa8, 0x38, 0x10, 0x40, VGA_TAIL_A, 0x42, 0x6e, VGA_TAIL_B}},
  {"PC_1280x1024x60",     {0x69, 0x70, 0xa8, 0x38, 0x10, 0x40, VGA_TAIL_A, 0x42, 0x6e, VGA_TAIL_B}},
  {"PC_1280x1024x75",     {0x69, 0x70, 0xf0, 0x38, 0x10, 0x40, VGA_TAIL_A, 0x42, 0x6e, VGA_TAIL_B}},
  {"PC_1280x1024x85",     {0x6b, 0xf0, 0xa8, 0x38, 0x10, 0x40, VGA_TAIL_A, 0x42, 0x6e, VGA_TAIL_B}},
  {"PC_1600x1200x60",     {0x86, 0xf0, 0xe8, 0x40, 0x10, 0x80, VGA_TAIL_A, 0x42, 0x6e, VGA_TAIL_B}},
  {"PC_1360x768x60",      {0x6f, 0xf0, 0x90, 0x10, 0x10, 0x40, VGA_TAIL_A, 0x40, 0x6f, VGA_TAIL_B}},
  {"PC_1680x1050x60",     {0x8b, 0xf0, 0xf0, 0xa8, 0x40, 0x40, VGA_TAIL_A, 0x40, 0x6f, VGA_TAIL_B}},
  {"PC_1440x900x60",      {0x76, 0xf0, 0xa8, 0x00, 0x20, 0x20, VGA_TAIL_A, 0x40, 0x6f, VGA_TAIL_B}},
  {"PC_1280x800x60",      {0x68, 0xf0, 0xa8, 0x00, 0x10, 0x40, VGA_TAIL_A, 0x40, 0x6f, VGA_TAIL_B}},
  {"PC_1280x960x60",      {0x70, 0x70, 0xb0, 0x00, 0x10, 0x40, VGA_TAIL_A, 0x40, 0x6f, VGA_TAIL_B}},
  {"PC_1920x1080x60",     {0x89, 0x70, 0xf0, 0x80, 0x30, 0x20, VGA_TAIL_A, 0x40, 0x6f, VGA_TAIL_B}},
  {"PC_1920x1200xReduce", {0x81, 0xf0, 0xf0, 0x80, 0x06, 0x10, VGA_TAIL_A, 0x40, 0x6f, VGA_TAIL_B}},
};

// [min, max) ranges of the hsync counter.
struct vga_detect_range { uint32_t min, max; const char *mode; };
static const vga_detect_range kVgaDetect[] = {
  {0x1a0, 0x240, "PC_480px60"},
  {0x240, 0x2d0, "PC_800x600x60"},
  {0x2d0, 0x310, "PC_720px60"},
  {0x310, 0x31d, "PC_1360x768x60"},
  {0x31e, 0x331, "PC_1024x768x60"},
  {0x332, 0x352, "PC_1280x800x60"},
  {0x3a0, 0x3a7, "PC_1440x900x60"},
  {0x3ad, 0x400, "PC_1280x960x60"},
  {0x420, 0x437, "PC_1280x1024x60"},
  {0x440, 0x459, "PC_1680x1050x60"},
  {0x459, 0x490, "PC_1920x1080x60"},
  {0x4d0, 0x4d7, "PC_1920x1200xReduce"},
  {0x4da, 0x510, "PC_1600x1200x60"},
};

bool vga_rx::initialize(bool, cap_error *err) {
  fprintf(stderr, "[rx] initialize VGA receiver\n");
  static const uint8_t init_seq[][2] = {
    {0x01, 0x69}, {0x02, 0xd0}, {0x03, 0x88}, {0x07, 0xf0}, {0x8f, 0x68},
    {0x86, 0x29}, {0x8d, 0x80}, {0x84, 0x00}, {0x87, 0x69}, {0x91, 0x30},
    {0x96, 0x22}, {0x98, 0x19}, {0x84, 0x0c}, {0x99, 0x08},
    {0x86, 0x0f},   // max driving strength
  };
  return write_pairs(bus_, init_seq, sizeof(init_seq) / sizeof(init_seq[0]), err);
}

bool vga_rx::read_hsync_counter(uint32_t *counter, cap_error *err) {
  uint8_t hi = 0, lo = 0;
  if (!bus_->set_byte(VGA_REG_HSYNC_COUNTER_REFRESH, VGA_HSYNC_COUNTER_REFRESH, err)) return false;
  if (!bus_->get(VGA_REG_HSYNC_COUNTER_H, &hi, err)) return false;
  if (!bus_->get(VGA_REG_HSYNC_COUNTER_L, &lo, err)) return false;
  *counter = (((uint32_t)hi << 4) & 0xf00) + lo;
  return true;
}

std::string vga_rx::mode_for_hsync_counter(uint32_t counter) {
  for (const auto &r : kVgaDetect)
    if (r.min <= counter && counter < r.max) return r.mode;
  return std::string();
}

bool vga_rx::mode_known(const std::string &mode) {
  for (const auto &m : kVgaModes)
    if (mode == m.name) return true;
  return false;
}

bool vga_rx::is_video_input_stable(bool *stable, cap_error *err) {
  uint8_t sync = 0;
  uint32_t counter = 0;
  if (!bus_->get(VGA_REG_SYNC_DETECT, &sync, err)) return false;
  if (!(sync & (VGA_BIT_HSYNC_DETECTED | VGA_BIT_VSYNC_DETECTED))) {
    *stable = false;
    return true;
  }
  if (!read_hsync_counter(&counter, err)) return false;
  *stable = !mode_for_hsync_counter(counter).empty();
  return true;
}

bool vga_rx::detect_mode(std::string *mode, cap_error *err) {
  uint32_t counter = 0;
  uint8_t sync = 0;
  if (!read_hsync_counter(&counter, err)) return false;
  if (!bus_->get(VGA_REG_SYNC_DETECT, &sync, err)) return false;
  if (sync & VGA_BIT_TV_MODE)
    return cap_fail(err, cap_err_kind::UNSUPPORTED, "detected TV mode which is not supported");
  *mode = mode_for_hsync_counter(counter);
  if (mode->empty())
    return cap_fail(err, cap_err_kind::FSM_FAILURE, "failed to detect the VGA mode, #hsync: 0x%x", counter);
  fprintf(stderr, "[rx] detected VGA mode: %s (#hsync: 0x%x)\n", mode->c_str(), counter);
  return true;
}

bool vga_rx::set_mode(const std::string &mode, cap_error *err) {
  for (const auto &m : kVgaModes) {
    if (mode != m.name) continue;
    for (size_t i = 0; i < VGA_MODE_REGS; i++)
      if (!bus_->set_byte((uint8_t)(i + 1), m.regs[i], err)) return false;
    return true;
  }
  return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "unsupported VGA mode: %s", mode.c_str());
}

bool vga_rx::frame_resolution(uint32_t *, uint32_t *, cap_error *err) {
  return cap_fail(err, cap_err_kind::UNSUPPORTED, "VGA receiver does not measure resolution");
}

bool vga_rx::dump_registers(std::vector<uint8_t> *out, cap_error *err) {
  return dump_256(bus_, out, err);
}
