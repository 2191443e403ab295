#pragma once
#include <stdint.h>

enum connector_id {
  CONN_DP1 = 1,
  CONN_DP2 = 2,
  CONN_HDMI = 3,
  CONN_VGA = 4,
};

enum connector_type { CONNECTOR_DP = 0, CONNECTOR_HDMI = 1, CONNECTOR_VGA = 2 };

inline bool connector_id_valid(int id) { return id >= CONN_DP1 && id <= CONN_VGA; }

inline connector_type connector_type_of(connector_id id) {
  if (id == CONN_HDMI) return CONNECTOR_HDMI;
  if (id == CONN_VGA) return CONNECTOR_VGA;
  return CONNECTOR_DP;
}

inline const char *connector_name(int id) {
  switch (id) {
    case CONN_DP1: return "DP1";
    case CONN_DP2: return "DP2";
    case CONN_HDMI: return "HDMI";
    case CONN_VGA: return "VGA";
  }
  return "?";
}
