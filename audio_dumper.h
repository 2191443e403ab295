#pragma once
#include <stdint.h>
#include <string>

#include "capture_error.h"
#include "fpga_mem.h"

// Hardware ring buffer producing whole pages; drained by memory_dumper.
class page_ring {
public:
  virtual ~page_ring() {}
  // Pages written since the run started; monotonically increasing.
  virtual uint32_t current_page_count() = 0;
  // Absolute address of page 0.
  virtual uint32_t start_address() const = 0;
  virtual uint32_t max_pages() const = 0;
  virtual uint32_t page_size() const = 0;
};

struct audio_data_format {
  std::string file_type = "raw";
  std::string sample_format = "S32_LE";
  int channel = 8;
  int rate = 48000;
};

// FPGA audio dump unit. Shares dump memory with the video dumpers.
class audio_dumper : public page_ring {
public:
  static const uint32_t kPageSize = 0x1000;
  static inline const uint32_t kDefaultStart = 0x1c000000;
  static inline const uint32_t kDefaultEnd = 0x1e000000;   // 0x2000 pages, ~21 s of audio

  explicit audio_dumper(fpga_mem *mem) : mem_(mem) {}

  bool start_dumping_to_memory(cap_error *err);
  // Reads the page count before stopping; stopping clears it.
  void stop_dumping_to_memory(uint32_t *mapped_start, uint32_t *page_count);
  bool is_dumping();

  uint32_t current_page_count() override;
  uint32_t start_address() const override;
  uint32_t max_pages() const override { return (kDefaultEnd - kDefaultStart) / kPageSize; }
  uint32_t page_size() const override { return kPageSize; }

  static audio_data_format data_format() { return audio_data_format(); }

private:
  fpga_mem *mem_;
};
