#ifndef __LINUX_I2C_H__
#define __LINUX_I2C_H__

#include <stdint.h>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "capture_error.h"

// Byte register access to one device. Receivers and I/O expanders sit behind this.
class reg_bus {
public:
  virtual ~reg_bus() {}

  virtual bool get(uint8_t offset, uint8_t *out, cap_error *err) = 0;
  virtual bool get_block(uint8_t offset, size_t size, std::vector<uint8_t> *out, cap_error *err) = 0;
  virtual bool set(uint8_t offset, const uint8_t *data, size_t len, cap_error *err) = 0;

  bool set_byte(uint8_t offset, uint8_t value, cap_error *err) { return set(offset, &value, 1, err); }
  bool set_mask(uint8_t offset, uint8_t mask, cap_error *err);
  bool clear_mask(uint8_t offset, uint8_t mask, cap_error *err);
  // Sets mask, waits delay_ms, clears it again.
  bool set_and_clear(uint8_t offset, uint8_t mask, uint32_t delay_ms, cap_error *err);
};

// A /dev/i2c-N adapter shared by the slaves on it.
class i2c_bus {
public:
  explicit i2c_bus(int bus_num);
  ~i2c_bus();

  i2c_bus(const i2c_bus&) = delete;
  i2c_bus& operator=(const i2c_bus&) = delete;

  bool open(std::string *err);

  // Extra board-level reset hook run by reset() (e.g. an FPGA reset line).
  void set_resetter(std::function<void()> fn);
  void reset();

  // Writes wlen bytes, then (if rlen) reads rlen bytes with a repeated start.
  bool transfer(uint8_t slave, const uint8_t *wbuf, uint16_t wlen,
                uint8_t *rbuf, uint16_t rlen, std::string *err);

private:
  int bus_num_;
  int fd_ = -1;
  std::mutex mtx_;
  std::function<void()> resetter_;
};

class i2c_slave : public reg_bus {
public:
  i2c_slave(i2c_bus *bus, uint8_t addr);

  bool get(uint8_t offset, uint8_t *out, cap_error *err) override;
  bool get_block(uint8_t offset, size_t size, std::vector<uint8_t> *out, cap_error *err) override;
  bool set(uint8_t offset, const uint8_t *data, size_t len, cap_error *err) override;

  uint8_t address() const { return addr_; }

  // 3 retries, 1 s initial backoff doubled each time, bus reset in between.
  int retry_count = 3;
  uint32_t retry_initial_delay_ms = 1000;

private:
  bool with_retry(const char *op, const std::function<bool(std::string*)> &fn, cap_error *err);

  i2c_bus *bus_;
  uint8_t addr_;
};

#endif
