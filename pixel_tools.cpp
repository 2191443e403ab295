#include "pixel_tools.h"

#include <errno.h>
#include <string.h>
#include <sys/wait.h>
#include <cstdio>
#include <cstdlib>
#include <sstream>

bool run_tool_capture(const std::string &cmd, std::vector<uint8_t> *out, cap_error *err) {
  FILE *p = popen(cmd.c_str(), "r");
  if (!p) return cap_fail(err, cap_err_kind::TOOL_FAILURE, "popen '%s': %s", cmd.c_str(), strerror(errno));
  out->clear();
  uint8_t buf[65536];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), p)) > 0) out->insert(out->end(), buf, buf + n);
  int st = pclose(p);
  if (st == -1) return cap_fail(err, cap_err_kind::TOOL_FAILURE, "pclose '%s': %s", cmd.c_str(), strerror(errno));
  if (!WIFEXITED(st) || WEXITSTATUS(st) != 0)
    return cap_fail(err, cap_err_kind::TOOL_FAILURE, "'%s' exited with status %d", cmd.c_str(),
                    WIFEXITED(st) ? WEXITSTATUS(st) : -1);
  return true;
}

bool subprocess_pixel_dump::dump_pixels(uint32_t addr, uint32_t w, uint32_t h, uint32_t bpp,
                                        std::vector<uint8_t> *out, cap_error *err) {
  char cmd[512];
  snprintf(cmd, sizeof(cmd), "%s -a 0x%08x - %u %u %u", path_.c_str(), addr, w, h, bpp);
  if (!run_tool_capture(cmd, out, err)) return false;
  size_t expect = (size_t)w * h * bpp;
  if (out->size() != expect)
    return cap_fail(err, cap_err_kind::TOOL_FAILURE, "pixeldump returned %zu bytes, expected %zu",
                    out->size(), expect);
  return true;
}

bool subprocess_pixel_dump::dump_pages(uint32_t addr, uint32_t page_size, uint32_t page_count,
                                       std::vector<uint8_t> *out, cap_error *err) {
  char cmd[512];
  snprintf(cmd, sizeof(cmd), "%s -a 0x%08x - %u %u 1", path_.c_str(), addr, page_size, page_count);
  if (!run_tool_capture(cmd, out, err)) return false;
  if (out->size() != (size_t)page_size * page_count)
    return cap_fail(err, cap_err_kind::TOOL_FAILURE, "pixeldump returned %zu bytes, expected %zu",
                    out->size(), (size_t)page_size * page_count);
  return true;
}

bool subprocess_histogram::compute(uint32_t w, uint32_t h, const std::vector<uint32_t> &addrs,
                                   std::vector<std::vector<float>> *out, cap_error *err) {
  if (addrs.empty()) {
    out->clear();
    return true;
  }
  std::ostringstream cmd;
  cmd << path_ << " " << w << " " << h << " -g " << kHistogramGrid << " -s " << kHistogramSamples;
  char tmp[32];
  for (uint32_t a : addrs) {
    snprintf(tmp, sizeof(tmp), " -a 0x%08x", a);
    cmd << tmp;
  }
  std::vector<uint8_t> raw;
  if (!run_tool_capture(cmd.str(), &raw, err)) return false;
  return parse_output(std::string(raw.begin(), raw.end()), addrs.size(), out, err);
}

bool subprocess_histogram::parse_output(const std::string &text, size_t expected_lines,
                                        std::vector<std::vector<float>> *out, cap_error *err) {
  const float samples = (float)(kHistogramSamples * kHistogramSamples);
  out->clear();
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
    std::vector<float> hist;
    hist.reserve(kHistogramSize);
    const char *s = line.c_str();
    char *end = nullptr;
    for (;;) {
      errno = 0;
      float v = strtof(s, &end);
      if (end == s) break;
      if (errno != 0) return cap_fail(err, cap_err_kind::TOOL_FAILURE, "bad histogram value");
      hist.push_back(v / samples);
      s = end;
    }
    if (hist.size() != kHistogramSize)
      return cap_fail(err, cap_err_kind::TOOL_FAILURE, "histogram line has %zu values, expected %zu",
                      hist.size(), kHistogramSize);
    out->push_back(hist);
  }
  if (out->size() != expected_lines)
    return cap_fail(err, cap_err_kind::TOOL_FAILURE, "histogram tool returned %zu lines, expected %zu",
                    out->size(), expected_lines);
  return true;
}
