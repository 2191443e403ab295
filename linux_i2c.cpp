#include "linux_i2c.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/ioctl.h>
#include <unistd.h>
#include <linux/i2c.h>
#include <linux/i2c-dev.h>
#include <cstdio>

#include "wait_util.h"

static int xioctl(int fd, unsigned long req, void *arg) {
  int r;
  do { r = ioctl(fd, req, arg); } while (r == -1 && errno == EINTR);
  return r;
}

bool reg_bus::set_mask(uint8_t offset, uint8_t mask, cap_error *err) {
  uint8_t v = 0;
  if (!get(offset, &v, err)) return false;
  return set_byte(offset, (uint8_t)(v | mask), err);
}

bool reg_bus::clear_mask(uint8_t offset, uint8_t mask, cap_error *err) {
  uint8_t v = 0;
  if (!get(offset, &v, err)) return false;
  return set_byte(offset, (uint8_t)(v & ~mask), err);
}

bool reg_bus::set_and_clear(uint8_t offset, uint8_t mask, uint32_t delay_ms, cap_error *err) {
  if (!set_mask(offset, mask, err)) return false;
  sleep_ms(delay_ms);
  return clear_mask(offset, mask, err);
}

// -------------------- i2c_bus --------------------
i2c_bus::i2c_bus(int bus_num) : bus_num_(bus_num) {}

i2c_bus::~i2c_bus() {
  if (fd_ >= 0) close(fd_);
}

bool i2c_bus::open(std::string *err) {
  char path[32];
  snprintf(path, sizeof(path), "/dev/i2c-%d", bus_num_);
  std::lock_guard<std::mutex> lk(mtx_);
  if (fd_ >= 0) close(fd_);
  fd_ = ::open(path, O_RDWR);
  if (fd_ < 0) {
    if (err) *err = std::string("open ") + path + ": " + strerror(errno);
    return false;
  }
  return true;
}

void i2c_bus::set_resetter(std::function<void()> fn) {
  std::lock_guard<std::mutex> lk(mtx_);
  resetter_ = fn;
}

void i2c_bus::reset() {
  std::function<void()> fn;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    fn = resetter_;
  }
  fprintf(stderr, "[i2c] resetting bus %d\n", bus_num_);
  if (fn) fn();
  std::string err;
  if (!open(&err)) fprintf(stderr, "[i2c] reopen failed: %s\n", err.c_str());
}

bool i2c_bus::transfer(uint8_t slave, const uint8_t *wbuf, uint16_t wlen,
                       uint8_t *rbuf, uint16_t rlen, std::string *err) {
  struct i2c_msg msgs[2];
  int n = 0;
  memset(msgs, 0, sizeof(msgs));
  if (wlen) {
    msgs[n].addr = slave;
    msgs[n].flags = 0;
    msgs[n].len = wlen;
    msgs[n].buf = const_cast<uint8_t*>(wbuf);
    n++;
  }
  if (rlen) {
    msgs[n].addr = slave;
    msgs[n].flags = I2C_M_RD;
    msgs[n].len = rlen;
    msgs[n].buf = rbuf;
    n++;
  }
  struct i2c_rdwr_ioctl_data data;
  data.msgs = msgs;
  data.nmsgs = (uint32_t)n;

  std::lock_guard<std::mutex> lk(mtx_);
  if (fd_ < 0) {
    if (err) *err = "bus not open";
    return false;
  }
  if (xioctl(fd_, I2C_RDWR, &data) < 0) {
    if (err) *err = strerror(errno);
    return false;
  }
  return true;
}

// -------------------- i2c_slave --------------------
i2c_slave::i2c_slave(i2c_bus *bus, uint8_t addr) : bus_(bus), addr_(addr) {}

bool i2c_slave::with_retry(const char *op, const std::function<bool(std::string*)> &fn, cap_error *err) {
  uint32_t delay = retry_initial_delay_ms;
  std::string last;
  for (int attempt = 0; ; attempt++) {
    if (fn(&last)) return true;
    if (attempt >= retry_count) break;
    fprintf(stderr, "[i2c] 0x%02x %s failed (%s); retry %d in %u ms\n",
            addr_, op, last.c_str(), attempt + 1, delay);
    sleep_ms(delay);
    delay *= 2;
    bus_->reset();
  }
  return cap_fail(err, cap_err_kind::BUS, "i2c 0x%02x %s: %s", addr_, op, last.c_str());
}

bool i2c_slave::get(uint8_t offset, uint8_t *out, cap_error *err) {
  return with_retry("get", [&](std::string *e) {
    return bus_->transfer(addr_, &offset, 1, out, 1, e);
  }, err);
}

bool i2c_slave::get_block(uint8_t offset, size_t size, std::vector<uint8_t> *out, cap_error *err) {
  if (size == 0 || size > 256) return cap_fail(err, cap_err_kind::INVALID_ARGUMENT, "bad block size %zu", size);
  out->assign(size, 0);
  return with_retry("get_block", [&](std::string *e) {
    return bus_->transfer(addr_, &offset, 1, out->data(), (uint16_t)size, e);
  }, err);
}

bool i2c_slave::set(uint8_t offset, const uint8_t *data, size_t len, cap_error *err) {
  std::vector<uint8_t> buf;
  buf.reserve(len + 1);
  buf.push_back(offset);
  buf.insert(buf.end(), data, data + len);
  return with_retry("set", [&](std::string *e) {
    return bus_->transfer(addr_, buf.data(), (uint16_t)buf.size(), nullptr, 0, e);
  }, err);
}
