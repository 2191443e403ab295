#include "audio_dumper.h"

static const uint32_t REGS_BASE = 0xff212000;
static const uint32_t REG_CTRL = 0x0;
static const uint32_t BIT_RUN = 1u << 1;
static const uint32_t REG_START_ADDR = 0x8;
static const uint32_t REG_END_ADDR = 0xc;
static const uint32_t REG_LOOP = 0x10;
static const uint32_t REG_PAGE_COUNT = 0x14;   // wraps at 65536
static const uint32_t DUMP_BASE = 0xc0000000;
static const uint32_t DUMP_SIZE = 0x3c000000;
// Loop keeps the page count growing past the ring size so overflow is visible.
static const uint32_t DEFAULT_LOOP = 1;

static bool check_address(const char *name, uint32_t addr, cap_error *err) {
  if (addr >= DUMP_SIZE)
    return cap_fail(err, cap_err_kind::INVALID_ARGUMENT,
                    "%s address 0x%x is not in the range of 0 to 0x%x", name, addr, DUMP_SIZE);
  if (addr & (audio_dumper::kPageSize - 1))
    return cap_fail(err, cap_err_kind::ALIGNMENT,
                    "%s address 0x%x is not aligned with 0x%x", name, addr, audio_dumper::kPageSize);
  return true;
}

bool audio_dumper::start_dumping_to_memory(cap_error *err) {
  mem_->clear_mask(REGS_BASE + REG_CTRL, BIT_RUN);
  if (!check_address("start", kDefaultStart, err)) return false;
  if (!check_address("end", kDefaultEnd, err)) return false;
  mem_->write(REGS_BASE + REG_START_ADDR, kDefaultStart);
  mem_->write(REGS_BASE + REG_END_ADDR, kDefaultEnd);
  mem_->write(REGS_BASE + REG_LOOP, DEFAULT_LOOP);
  mem_->set_mask(REGS_BASE + REG_CTRL, BIT_RUN);
  return true;
}

void audio_dumper::stop_dumping_to_memory(uint32_t *mapped_start, uint32_t *page_count) {
  uint32_t start = mem_->read(REGS_BASE + REG_START_ADDR);
  uint32_t count = mem_->read(REGS_BASE + REG_PAGE_COUNT);
  mem_->clear_mask(REGS_BASE + REG_CTRL, BIT_RUN);
  if (mapped_start) *mapped_start = start + DUMP_BASE;
  if (page_count) *page_count = count;
}

bool audio_dumper::is_dumping() {
  return (mem_->read(REGS_BASE + REG_CTRL) & BIT_RUN) != 0;
}

uint32_t audio_dumper::current_page_count() {
  return mem_->read(REGS_BASE + REG_PAGE_COUNT);
}

uint32_t audio_dumper::start_address() const {
  return DUMP_BASE + kDefaultStart;
}
