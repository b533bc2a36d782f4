#include "core/Settings.hpp"
#include "debug/json_debug.hpp"
#include "models/TrackErrors.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

json load_json_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw ConfigurationError(path, "cannot open " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();

  try {
    return json::parse(text);
  } catch (const json::parse_error &e) {
    throw ConfigurationError(path,
                             describe_json_error(path, text, e.byte, e.what()));
  }
}

static void env_override(const char *name, std::string &field) {
  if (const char *v = std::getenv(name); v && *v)
    field = v;
}

Settings settings_from_json(const json &j) {
  Settings s;
  try {
    if (j.contains("server")) {
      const auto &sv = j.at("server");
      s.server.port = sv.value("port", s.server.port);
      s.server.upload_dir = sv.value("upload_dir", s.server.upload_dir);
      if (sv.contains("post_endpoints"))
        s.server.post_endpoints =
            sv.at("post_endpoints").get<std::vector<std::string>>();
      if (sv.contains("get_endpoints"))
        s.server.get_endpoints =
            sv.at("get_endpoints").get<std::vector<std::string>>();
    }
    if (j.contains("db")) {
      const auto &d = j.at("db");
      s.db.enabled = d.value("enabled", s.db.enabled);
      s.db.host = d.value("host", s.db.host);
      s.db.port = d.value("port", s.db.port);
      s.db.user = d.value("user", s.db.user);
      s.db.password = d.value("password", s.db.password);
      s.db.schema = d.value("schema", s.db.schema);
    }
  } catch (const json::exception &e) {
    throw ConfigurationError("settings", std::string("bad settings: ") +
                                             e.what());
  }
  if (j.contains("cycles"))
    s.cycles.merge_json(j.at("cycles"));

  env_override("DB_HOST", s.db.host);
  env_override("DB_USER", s.db.user);
  env_override("DB_PASS", s.db.password);
  env_override("DB_NAME", s.db.schema);
  std::string port;
  env_override("DB_PORT", port);
  if (!port.empty()) {
    try {
      s.db.port = std::stoi(port);
    } catch (const std::exception &) {
      throw ConfigurationError("DB_PORT", "DB_PORT is not a number: " + port);
    }
  }

  if (s.server.port <= 0 || s.server.port > 65535)
    throw ConfigurationError("server.port", "server.port out of range");
  s.cycles.validate();
  return s;
}

Settings load_settings(const std::string &path) {
  return settings_from_json(load_json_file(path));
}

CycleParams load_params_file(const std::string &path, CycleParams base) {
  const json j = load_json_file(path);
  if (!j.is_object())
    throw ConfigurationError(path, path + ": expected a JSON object");
  base.merge_json(j.contains("cycles") ? j.at("cycles") : j);
  return base;
}
