#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <vector>

#include "capture_error.h"

class capture_service;

// Wiring from main program.
void rpc_set_service(capture_service *svc);
void rpc_set_config_json_provider(std::string (*fn)());
void rpc_set_status_provider(std::string (*fn)());
void rpc_set_quit_flag(std::atomic<bool> *quit_flag);
void rpc_set_listen_address(const std::string &addr);

// HTTP status for an error kind.
int rpc_http_status(cap_err_kind kind);

struct rpc_reply {
  int http_status = 200;
  std::string content_type = "application/json";
  std::string body;
};

// Runs one RPC method with a JSON object body. Pixel data is returned raw as
// application/octet-stream; everything else as JSON. Errors are
// {"error": msg, "kind": name} with the status from rpc_http_status().
// Callers serialize; the server does so with its call mutex.
void rpc_dispatch(capture_service &svc, const std::string &method, const std::string &body, rpc_reply &out);

// POST /rpc/<method>: rpc_dispatch() on the current service under the call
// mutex; 500 when no service is set.
void rpc_call(const std::string &method, const std::string &body, rpc_reply &out);
// Runs fn while no call is in flight and none can start. Tear the service
// down in here.
void rpc_exclusive(const std::function<void()> &fn);

std::vector<std::string> rpc_method_names();

// Start server: POST /rpc/<Method>, GET /api/thumbnail/<id>, /api/status,
// /api/config, /api/methods, POST /api/quit.
void rpc_start_detached(int port);
