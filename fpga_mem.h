#pragma once
#include <stdint.h>
#include <string>

// 32-bit access to FPGA-mapped registers and dump memory.
class fpga_mem {
public:
  virtual ~fpga_mem() {}

  virtual uint32_t read(uint32_t addr) = 0;
  virtual void write(uint32_t addr, uint32_t value) = 0;

  void set_mask(uint32_t addr, uint32_t mask) { write(addr, read(addr) | mask); }
  void clear_mask(uint32_t addr, uint32_t mask) { write(addr, read(addr) & ~mask); }
};

// One mmap()'d window of /dev/mem.
class devmem_region : public fpga_mem {
public:
  // Controller window holding dumper, audio and HPD registers.
  static const uint32_t kControllerBase = 0xff210000;
  static const uint32_t kControllerSize = 0x10000;

  devmem_region(uint32_t base, uint32_t size);
  ~devmem_region() override;

  devmem_region(const devmem_region&) = delete;
  devmem_region& operator=(const devmem_region&) = delete;

  bool open(const char *dev_path, std::string *err);
  bool is_open() const { return map_ != nullptr; }

  // Out-of-window accesses are logged; reads return 0xffffffff.
  uint32_t read(uint32_t addr) override;
  void write(uint32_t addr, uint32_t value) override;

private:
  volatile uint32_t *word_ptr(uint32_t addr);

  uint32_t base_;
  uint32_t size_;
  int fd_ = -1;
  void *map_ = nullptr;
};
