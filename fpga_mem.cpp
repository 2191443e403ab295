#include "fpga_mem.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/mman.h>
#include <unistd.h>
#include <cstdio>

devmem_region::devmem_region(uint32_t base, uint32_t size) : base_(base), size_(size) {}

devmem_region::~devmem_region() {
  if (map_) munmap(map_, size_);
  if (fd_ >= 0) close(fd_);
}

bool devmem_region::open(const char *dev_path, std::string *err) {
  fd_ = ::open(dev_path, O_RDWR | O_SYNC);
  if (fd_ < 0) {
    if (err) *err = std::string("open ") + dev_path + ": " + strerror(errno);
    return false;
  }
  void *m = mmap(nullptr, size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, (off_t)base_);
  if (m == MAP_FAILED) {
    if (err) *err = std::string("mmap: ") + strerror(errno);
    close(fd_);
    fd_ = -1;
    return false;
  }
  map_ = m;
  fprintf(stderr, "[mem] mapped 0x%08x+0x%x from %s\n", base_, size_, dev_path);
  return true;
}

volatile uint32_t *devmem_region::word_ptr(uint32_t addr) {
  if (!map_ || addr < base_ || addr - base_ + 4 > size_ || (addr & 3)) {
    fprintf(stderr, "[mem] access outside window: 0x%08x\n", addr);
    return nullptr;
  }
  return reinterpret_cast<volatile uint32_t*>(static_cast<uint8_t*>(map_) + (addr - base_));
}

uint32_t devmem_region::read(uint32_t addr) {
  volatile uint32_t *p = word_ptr(addr);
  return p ? *p : 0xffffffffu;
}

void devmem_region::write(uint32_t addr, uint32_t value) {
  volatile uint32_t *p = word_ptr(addr);
  if (p) *p = value;
}
