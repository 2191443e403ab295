#pragma once
#include <stdint.h>
#include <string>
#include <vector>

#include "capture_error.h"

// Reads raw dump memory. Implemented by the pixeldump helper on the board.
class pixel_dump_tool {
public:
  virtual ~pixel_dump_tool() {}

  // w x h pixels of bpp bytes stored contiguously at addr.
  virtual bool dump_pixels(uint32_t addr, uint32_t w, uint32_t h, uint32_t bpp,
                           std::vector<uint8_t> *out, cap_error *err) = 0;
  // page_count pages of page_size bytes starting at addr.
  virtual bool dump_pages(uint32_t addr, uint32_t page_size, uint32_t page_count,
                          std::vector<uint8_t> *out, cap_error *err) = 0;
};

static const size_t kHistogramGrid = 3;
static const size_t kHistogramSamples = 10;
static const size_t kHistogramBuckets = 4;
static const size_t kHistogramSize = kHistogramGrid * kHistogramGrid * 3 * kHistogramBuckets;

// Samples a 3x3 grid of an RGB888 image at each address.
class histogram_tool {
public:
  virtual ~histogram_tool() {}

  // One kHistogramSize vector per address, each bucket divided by the
  // number of samples in its cell.
  virtual bool compute(uint32_t w, uint32_t h, const std::vector<uint32_t> &addrs,
                       std::vector<std::vector<float>> *out, cap_error *err) = 0;
};

// Runs cmd through the shell and collects stdout. Non-zero exit is TOOL_FAILURE.
bool run_tool_capture(const std::string &cmd, std::vector<uint8_t> *out, cap_error *err);

class subprocess_pixel_dump : public pixel_dump_tool {
public:
  explicit subprocess_pixel_dump(const std::string &path) : path_(path) {}

  bool dump_pixels(uint32_t addr, uint32_t w, uint32_t h, uint32_t bpp,
                   std::vector<uint8_t> *out, cap_error *err) override;
  bool dump_pages(uint32_t addr, uint32_t page_size, uint32_t page_count,
                  std::vector<uint8_t> *out, cap_error *err) override;

private:
  std::string path_;
};

class subprocess_histogram : public histogram_tool {
public:
  explicit subprocess_histogram(const std::string &path) : path_(path) {}

  bool compute(uint32_t w, uint32_t h, const std::vector<uint32_t> &addrs,
               std::vector<std::vector<float>> *out, cap_error *err) override;

  // Parses the tool's output: one line of kHistogramSize counts per address.
  static bool parse_output(const std::string &text, size_t expected_lines,
                           std::vector<std::vector<float>> *out, cap_error *err);

private:
  std::string path_;
};
