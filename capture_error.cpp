#include "capture_error.h"

#include <cstdarg>
#include <cstdio>
#include <string>

const char *cap_err_kind_name(cap_err_kind k) {
  switch (k) {
    case cap_err_kind::NONE: return "none";
    case cap_err_kind::BUS: return "bus";
    case cap_err_kind::TIMEOUT: return "timeout";
    case cap_err_kind::CABLE_DISCONNECTED: return "cableDisconnected";
    case cap_err_kind::PORT_NOT_PLUGGED: return "portNotPlugged";
    case cap_err_kind::FSM_FAILURE: return "fsmFailure";
    case cap_err_kind::ALIGNMENT: return "alignment";
    case cap_err_kind::OVERFLOW: return "overflow";
    case cap_err_kind::INVALID_ARGUMENT: return "invalidArgument";
    case cap_err_kind::INVALID_STATE: return "invalidState";
    case cap_err_kind::UNSUPPORTED: return "unsupported";
    case cap_err_kind::TOOL_FAILURE: return "toolFailure";
  }
  return "unknown";
}

bool cap_err_is_link_error(cap_err_kind k) {
  return k == cap_err_kind::CABLE_DISCONNECTED ||
         k == cap_err_kind::PORT_NOT_PLUGGED ||
         k == cap_err_kind::FSM_FAILURE;
}

bool cap_fail(cap_error *err, cap_err_kind kind, const char *fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  va_list ap2;
  va_copy(ap2, ap);
  int n = vsnprintf(nullptr, 0, fmt, ap);
  va_end(ap);
  std::string msg;
  if (n > 0) {
    msg.resize((size_t)n + 1);
    vsnprintf(&msg[0], msg.size(), fmt, ap2);
    msg.resize((size_t)n);
  }
  va_end(ap2);
  fprintf(stderr, "[error] %s: %s\n", cap_err_kind_name(kind), msg.c_str());
  if (err) {
    err->kind = kind;
    err->msg = msg;
    err->reg_dump.clear();
  }
  return false;
}

void cap_dump_append_u32(std::vector<uint8_t> &dump, uint32_t v) {
  dump.push_back((uint8_t)(v & 0xff));
  dump.push_back((uint8_t)((v >> 8) & 0xff));
  dump.push_back((uint8_t)((v >> 16) & 0xff));
  dump.push_back((uint8_t)((v >> 24) & 0xff));
}

std::string cap_dump_to_hex(const std::vector<uint8_t> &dump) {
  std::string out;
  char tmp[8];
  for (size_t i = 0; i < dump.size(); i++) {
    if ((i % 16) == 0) {
      if (i) out += "\n";
      snprintf(tmp, sizeof(tmp), "%02zx:", i);
      out += tmp;
    }
    snprintf(tmp, sizeof(tmp), " %02x", dump[i]);
    out += tmp;
  }
  return out;
}
