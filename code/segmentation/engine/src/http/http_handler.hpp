#pragma once

#include "core/Settings.hpp"
#include "httplib.h"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

// Thin wrapper around httplib callbacks.  The main server forwards requests to
// these member functions based on the action string parsed from the URL.
class HttpHandler {
public:
  explicit HttpHandler(Settings settings) : settings_(std::move(settings)) {}

  void callPostHandler(std::string action, const httplib::Request &req,
                       httplib::Response &res);
  void callGetHandler(std::string action, const httplib::Request &req,
                      httplib::Response &res);

  const Settings &settings() const noexcept { return settings_; }

private:
  Settings settings_;

  // Individual request handlers
  void handleUpload(const httplib::Request &req, httplib::Response &res);
  void handleCycles(const httplib::Request &req, httplib::Response &res);
  void handleView(const httplib::Request &req, httplib::Response &res);
  void handleDBPing(const httplib::Request &req, httplib::Response &res);

  bool isSafeTrackPath(const std::string &path) const;
};

// Regular files in `dir`, newest first: [{file, name, bytes}]
nlohmann::json list_uploads_json(const std::string &dir);
