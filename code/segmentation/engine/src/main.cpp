// Entry point for the haul-cycle HTTP server.  It wires up the httplib
// server, loads configuration and exposes the REST endpoints handled by
// `HttpHandler`.

#include "core/Settings.hpp"
#include "http/http_handler.hpp"
#include "models/TrackErrors.hpp"
#include <nlohmann/json.hpp>

#include <execinfo.h>
#include <iostream>
#include <signal.h>
#include <unistd.h>

using json = nlohmann::json;

static void bt_handler(int sig) {
  void *bt[64];
  int n = backtrace(bt, 64);
  dprintf(2, "\n=== FATAL SIG %d ===\n", sig);
  backtrace_symbols_fd(bt, n, 2);
  _exit(128 + sig);
}
static void install_bt_handlers() {
  signal(SIGSEGV, bt_handler);
  signal(SIGABRT, bt_handler);
  signal(SIGFPE, bt_handler);
  signal(SIGILL, bt_handler);
  signal(SIGBUS, bt_handler);
}

int main(int argc, char **argv) {
  install_bt_handlers();

  // settings path: first argument, else the bundled config
  const std::string cfg_path = argc > 1 ? argv[1] : "config/settings.json";
  Settings settings;
  try {
    settings = load_settings(cfg_path);
  } catch (const ConfigurationError &e) {
    std::cerr << "[ERROR] " << e.what() << "\n";
    return 2;
  }
  const int port = settings.server.port;
  std::cout << "[DEBUG] Starting server on port " << port << std::endl;
  if (settings.db.enabled)
    std::cout << "[DEBUG] Cycle store " << settings.db.uri() << "/"
              << settings.db.schema << std::endl;

  // ---------------------- HTTP server setup -------------------------------
  httplib::Server server;
  server.set_payload_max_length(1024ull * 1024ull * 64ull); // GPX uploads
  server.set_read_timeout(60, 0);
  server.set_write_timeout(60, 0);

  HttpHandler handler(settings);

  // ---------------------- Register POST endpoints -------------------------
  for (const auto &path : settings.server.post_endpoints) {
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Post(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callPostHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[POST " << action << "] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(json{{"ok", false}, {"error", e.what()}}.dump(),
                        "application/json");
      }
    });
  }

  // ---------------------- Register GET endpoints --------------------------
  for (const auto &path : settings.server.get_endpoints) {
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Get(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callGetHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[GET " << action << "] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(json{{"ok", false}, {"error", e.what()}}.dump(),
                        "application/json");
      }
    });
  }

  // Non-configurable helper endpoint listing uploaded files
  const std::string upload_dir = settings.server.upload_dir;
  server.Get("/lab/list",
             [upload_dir](const httplib::Request &, httplib::Response &res) {
               const auto arr = list_uploads_json(upload_dir);
               json out = {{"files", arr}};
               res.set_content(out.dump(), "application/json");
             });

  // ---------------------- Start server ------------------------------------
  if (!server.listen("0.0.0.0", port)) {
    std::cerr << "[ERROR] cannot listen on port " << port << "\n";
    return 1;
  }
  return 0;
}
