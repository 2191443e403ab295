#include "video_dumper.h"

#include "capture_error.h"

static const uint32_t kRegsBase[2] = {0xff210000, 0xff211000};
static const uint32_t kCaptureStart[2] = {0x00000000, 0x20000000};
static const uint32_t kTempStart[2] = {0x1b400000, 0x3b400000};

static const uint32_t REG_CTRL = 0x0;
static const uint32_t BIT_CLK_NORMAL = 0;
static const uint32_t BIT_CLK_ALT = 1u << 1;
static const uint32_t BIT_RUN = 1u << 2;
static const uint32_t BIT_RUN_DUAL = 1u << 3;   // runs only when set on both dumpers
static const uint32_t BIT_HASH_64 = 1u << 4;
static const uint32_t BIT_CROP = 1u << 5;
static const uint32_t REG_START_ADDR = 0x8;     // offsets from kDumpBase
static const uint32_t REG_END_ADDR = 0xc;
static const uint32_t REG_LOOP = 0x10;
static const uint32_t REG_LIMIT = 0x14;
static const uint32_t REG_WIDTH = 0x18;
static const uint32_t REG_HEIGHT = 0x1c;
static const uint32_t REG_FIELD_COUNT = 0x20;
static const uint32_t REG_CROP_XRANGE = 0x24;
static const uint32_t REG_CROP_YRANGE = 0x28;
static const uint32_t REG_HASH_BUF_BASE = 0x400;
static const uint32_t HASH_BUF_SIZE = 1024;

static const uint32_t kDefaultLimit = 1;

video_dumper::video_dumper(fpga_mem *mem, int index)
  : mem_(mem), index_(index), base_(kRegsBase[index & 1]) {}

int video_dumper::primary_index(connector_id id) {
  return (id == CONN_DP2 || id == CONN_HDMI) ? 1 : 0;
}

int video_dumper::even_pixels_index(connector_id id) {
  return id == CONN_DP2 ? 1 : 0;
}

std::vector<int> video_dumper::effective_indexes(connector_id id, bool dual) {
  if (dual) {
    int even = even_pixels_index(id);
    return {even, 1 - even};
  }
  return {primary_index(id)};
}

static uint64_t page_aligned_size(uint32_t w, uint32_t h) {
  uint64_t sz = (uint64_t)w * h * video_dumper::kBytesPerPixel;
  if (sz == 0) return 0;
  return ((sz - 1) / video_dumper::kPageSize + 1) * video_dumper::kPageSize;
}

uint32_t video_dumper::aligned_field_size(uint32_t w, uint32_t h) {
  return (uint32_t)page_aligned_size(w, h);
}

uint32_t video_dumper::max_field_limit(uint32_t w, uint32_t h) {
  uint64_t sz = page_aligned_size(w, h);
  if (sz == 0) return 0;
  return (uint32_t)(kBufferSize / sz);
}

uint32_t video_dumper::capture_address() const {
  return kDumpBase + kCaptureStart[index_ & 1];
}

void video_dumper::stop() {
  mem_->clear_mask(reg(REG_CTRL), BIT_RUN | BIT_RUN_DUAL);
}

void video_dumper::start(connector_id id, bool dual) {
  uint32_t bit_run;
  if (dual) bit_run = BIT_RUN_DUAL;
  else if (index_ == primary_index(id)) bit_run = BIT_RUN;
  else return;
  mem_->set_mask(reg(REG_CTRL), bit_run);
}

void video_dumper::select(connector_id id, bool dual) {
  stop();
  set_dump_address_for_temp();
  set_field_limit(kDefaultLimit, false);
  uint32_t ctrl = (index_ == primary_index(id)) ? BIT_CLK_NORMAL : BIT_CLK_ALT;
  if (!dual) ctrl |= BIT_HASH_64;
  mem_->write(reg(REG_CTRL), ctrl);
  start(id, dual);
}

void video_dumper::set_dump_address_for_capture() {
  mem_->write(reg(REG_START_ADDR), kCaptureStart[index_ & 1]);
  mem_->write(reg(REG_END_ADDR), kCaptureStart[index_ & 1] + kBufferSize);
}

void video_dumper::set_dump_address_for_temp() {
  mem_->write(reg(REG_START_ADDR), kTempStart[index_ & 1]);
  mem_->write(reg(REG_END_ADDR), kTempStart[index_ & 1] + kTempBufferSize);
}

void video_dumper::set_field_limit(uint32_t limit, bool loop) {
  mem_->write(reg(REG_LIMIT), limit);
  mem_->write(reg(REG_LOOP), loop ? 1 : 0);
}

void video_dumper::enable_crop(uint32_t x, uint32_t y, uint32_t w, uint32_t h) {
  uint32_t right = x + w;
  uint32_t bottom = y + h;
  mem_->write(reg(REG_CROP_XRANGE), (right << 16) | x);
  mem_->write(reg(REG_CROP_YRANGE), (bottom << 16) | y);
  mem_->set_mask(reg(REG_CTRL), BIT_CROP);
}

void video_dumper::disable_crop() {
  mem_->clear_mask(reg(REG_CTRL), BIT_CROP);
}

uint32_t video_dumper::width() { return mem_->read(reg(REG_WIDTH)); }
uint32_t video_dumper::height() { return mem_->read(reg(REG_HEIGHT)); }
uint32_t video_dumper::field_count() { return mem_->read(reg(REG_FIELD_COUNT)); }

// The FPGA overwrites old hashes once the buffer wraps; callers must save
// them before that happens.
std::vector<uint16_t> video_dumper::field_hash(uint32_t index, bool dual) {
  auto hash_addr = [this](uint32_t x) {
    return base_ + REG_HASH_BUF_BASE + (x * 4) % HASH_BUF_SIZE;
  };
  if (dual) {
    uint32_t h = mem_->read(hash_addr(index));
    return {(uint16_t)(h >> 16), (uint16_t)(h & 0xffff)};
  }
  uint32_t w0 = mem_->read(hash_addr(index * 2));
  uint32_t w1 = mem_->read(hash_addr(index * 2 + 1));
  return {(uint16_t)(w1 >> 16), (uint16_t)(w1 & 0xffff),
          (uint16_t)(w0 >> 16), (uint16_t)(w0 & 0xffff)};
}

void video_dumper::append_register_dump(std::vector<uint8_t> &dump) {
  static const uint32_t regs[] = {REG_CTRL, REG_START_ADDR, REG_END_ADDR, REG_LOOP,
                                  REG_LIMIT, REG_WIDTH, REG_HEIGHT, REG_FIELD_COUNT};
  for (uint32_t r : regs) cap_dump_append_u32(dump, mem_->read(reg(r)));
}
