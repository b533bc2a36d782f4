#pragma once
#include "models/params.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct ServerSettings {
  int port = 5005;
  std::string upload_dir = "uploads";
  std::vector<std::string> post_endpoints{"/upload", "/cycles"};
  std::vector<std::string> get_endpoints{"/view", "/dbping"};
};

struct DbSettings {
  bool enabled = false;
  std::string host = "127.0.0.1";
  int port = 3306;
  std::string user = "haulcycle_user";
  std::string password;
  std::string schema = "haulcycle";

  std::string uri() const {
    return "tcp://" + host + ":" + std::to_string(port);
  }
};

// config/settings.json
struct Settings {
  ServerSettings server;
  CycleParams cycles; // defaults for every request / run
  DbSettings db;
};

// Reads and parses a JSON file. Throws ConfigurationError (key = path) with
// line/column and a snippet when the text is not valid JSON.
nlohmann::json load_json_file(const std::string &path);

// Parses the settings document, then applies DB_HOST, DB_PORT, DB_USER,
// DB_PASS and DB_NAME from the environment. Validates the cycle block.
Settings settings_from_json(const nlohmann::json &j);
Settings load_settings(const std::string &path);

// A params file is either a full settings document (its "cycles" block is
// used) or a bare CycleParams object. Keys overlay `base`.
CycleParams load_params_file(const std::string &path, CycleParams base = {});
