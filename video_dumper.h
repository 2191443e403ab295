#pragma once
#include <stdint.h>
#include <vector>

#include "connector_ids.h"
#include "fpga_mem.h"

// One FPGA video dump unit (index 0 = dumper A, 1 = dumper B).
//
//  Input                           | DP1 | DP2 | HDMI | VGA |
//  SINGLE PIXEL DATA / CLOCK       | A   | B   | B    | A   |
//  DUAL PIXEL EVEN PIXELS DATA     | A   | B   | A    |     |
//  DUAL PIXEL ODD PIXELS DATA      | B   | A   | B    |     |
class video_dumper {
public:
  static const uint32_t kDumpBase = 0xc0000000;
  static const uint32_t kBufferSize = 0x1b400000;
  static const uint32_t kTempBufferSize = 0x00c00000;
  static const uint32_t kPageSize = 4096;
  static const uint32_t kBytesPerPixel = 3;

  video_dumper(fpga_mem *mem, int index);

  int index() const { return index_; }

  static int primary_index(connector_id id);
  static int even_pixels_index(connector_id id);
  // Dumpers that carry the connector's data, even-pixel path first in dual mode.
  static std::vector<int> effective_indexes(connector_id id, bool dual);

  // Page-aligned byte size of one dumped field of w x h pixels.
  // Only meaningful for fields that fit the buffer.
  static uint32_t aligned_field_size(uint32_t w, uint32_t h);
  // Largest n with n * aligned_field_size(w, h) <= kBufferSize.
  static uint32_t max_field_limit(uint32_t w, uint32_t h);

  // Absolute address of the capture ring of this dumper.
  uint32_t capture_address() const;

  void stop();
  void start(connector_id id, bool dual);
  // Parks the dumper on its temporary area, single field, no loop, and starts it.
  void select(connector_id id, bool dual);

  void set_dump_address_for_capture();
  void set_dump_address_for_temp();
  void set_field_limit(uint32_t limit, bool loop);
  void enable_crop(uint32_t x, uint32_t y, uint32_t w, uint32_t h);
  void disable_crop();

  uint32_t width();
  uint32_t height();
  uint32_t field_count();

  // Four hash16 values in single mode (64-bit hash), two in dual mode.
  std::vector<uint16_t> field_hash(uint32_t index, bool dual);

  // CTRL, START, END, LOOP, LIMIT, WIDTH, HEIGHT, FIELD_COUNT words.
  void append_register_dump(std::vector<uint8_t> &dump);

private:
  uint32_t reg(uint32_t off) const { return base_ + off; }

  fpga_mem *mem_;
  int index_;
  uint32_t base_;
};
