#include "core/CycleEngine.hpp"
#include "core/Settings.hpp"
#include "models/ReportJson.hpp"
#include "models/TrackErrors.hpp"
#include "track_fixtures.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace fixtures;
using json = nlohmann::json;
namespace fs = std::filesystem;

// Runs fn and returns the key of the ConfigurationError it throws ("" if none).
template <typename Fn> static std::string config_error_key(Fn &&fn) {
  try {
    fn();
  } catch (const ConfigurationError &e) {
    return e.key();
  }
  return "";
}

static void check_defaults() {
  CycleParams p;
  p.validate();
  assert(p.speed_high == 1.0 && p.speed_low == 0.3);
  assert(p.min_idle_duration_s == 60.0);
  assert(p.min_cycle_duration_s == 60.0);
  assert(p.min_cycle_distance_m == 50.0);
  assert(p.speed_median_window == 1);
  assert(!p.require_cycles && !p.load_zone && !p.dump_zone);
  pass("defaults are valid");
}

static void check_validation() {
  CycleParams p;
  p.speed_low = 1.0; // == speed_high
  assert(config_error_key([&] { p.validate(); }) == "speed_low");
  p.speed_low = 2.0;
  assert(config_error_key([&] { p.validate(); }) == "speed_low");

  CycleParams q;
  q.min_idle_duration_s = -1.0;
  assert(config_error_key([&] { q.validate(); }) == "min_idle_duration_s");

  CycleParams w;
  w.speed_median_window = 0;
  assert(config_error_key([&] { w.validate(); }) == "speed_median_window");

  CycleParams z;
  Zone bad;
  bad.radius_m = 0.0;
  z.dump_zone = bad;
  assert(config_error_key([&] { z.validate(); }) == "dump_zone");
  bad.radius_m = 50.0;
  bad.lat = 123.0;
  z.dump_zone.reset();
  z.load_zone = bad;
  assert(config_error_key([&] { z.validate(); }) == "load_zone");
  pass("inconsistent thresholds raise ConfigurationError with the key");
}

static void check_engine_validates_first() {
  CycleParams p;
  p.speed_low = 5.0;
  CycleEngine engine(p);
  // raised before the (empty) track is looked at
  assert(config_error_key([&] { engine.process({}); }) == "speed_low");

  CycleEngine ok;
  assert(config_error_key([&] { ok.setParams(p); }) == "speed_low");
  assert(ok.params().speed_low == 0.3);
  pass("engine rejects bad params before processing");
}

static void check_merge_json() {
  CycleParams p;
  p.merge_json(json{{"speed_high", 2.5},
                    {"min_idle_duration_s", 30},
                    {"require_cycles", true},
                    {"dump_zone", {{"lat", 40.1}, {"lon", -105.2}}},
                    {"output_prefix", "run1_"}});
  assert(p.speed_high == 2.5);
  assert(p.speed_low == 0.3); // untouched
  assert(p.min_idle_duration_s == 30.0);
  assert(p.require_cycles);
  assert(p.dump_zone && p.dump_zone->radius_m == 100.0);
  assert(p.output_prefix == "run1_");
  p.validate();

  p.merge_json(json{{"dump_zone", nullptr}});
  assert(!p.dump_zone);

  CycleParams q;
  assert(config_error_key([&] {
           q.merge_json(json{{"speed_low", "slow"}});
         }) == "speed_low");
  assert(config_error_key([&] {
           q.merge_json(json{{"load_zone", {{"lat", 1.0}}}});
         }) == "load_zone");

  // JSON view round-trips through merge_json
  CycleParams r = CycleParams::from_json(json(p));
  assert(r.speed_high == p.speed_high && r.require_cycles == p.require_cycles);
  pass("partial JSON overlays and type errors");
}

static std::string write_temp(const std::string &name,
                              const std::string &text) {
  fs::path dir = fs::temp_directory_path() / "haulcycle_verify_params";
  fs::create_directories(dir);
  fs::path p = dir / name;
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out << text;
  return p.string();
}

static void check_files() {
  const std::string settings_path = write_temp("settings.json", R"({
  "server": {"port": 6006, "get_endpoints": ["/view"]},
  "cycles": {"min_idle_duration_s": 45, "speed_median_window": 3},
  "db": {"enabled": true, "host": "db.local", "user": "u", "schema": "s"}
})");
  ::setenv("DB_HOST", "override.local", 1);
  ::setenv("DB_PORT", "3307", 1);
  Settings s = load_settings(settings_path);
  ::unsetenv("DB_HOST");
  ::unsetenv("DB_PORT");
  assert(s.server.port == 6006);
  assert(s.server.get_endpoints.size() == 1);
  assert(s.server.post_endpoints.size() == 2); // default kept
  assert(s.cycles.min_idle_duration_s == 45.0);
  assert(s.cycles.speed_median_window == 3);
  assert(s.db.enabled && s.db.user == "u" && s.db.schema == "s");
  assert(s.db.host == "override.local" && s.db.port == 3307);
  assert(s.db.uri() == "tcp://override.local:3307");

  // a settings document and a bare params object both work as --config
  CycleParams from_settings = load_params_file(settings_path);
  assert(from_settings.min_idle_duration_s == 45.0);
  const std::string bare = write_temp("bare.json", R"({"speed_high": 3})");
  CycleParams from_bare = load_params_file(bare);
  assert(from_bare.speed_high == 3.0);

  const std::string broken =
      write_temp("broken.json", "{\n  \"cycles\": {\n    \"speed_high\": ,\n");
  bool threw = false;
  try {
    load_settings(broken);
  } catch (const ConfigurationError &e) {
    threw = true;
    const std::string msg = e.what();
    assert(e.key() == broken);
    assert(msg.find(broken + ":3:") != std::string::npos);
    assert(msg.find('^') != std::string::npos);
  }
  assert(threw);

  assert(config_error_key([] { load_json_file("/nonexistent/x.json"); }) ==
         "/nonexistent/x.json");

  const std::string bad_port =
      write_temp("bad_port.json", R"({"server": {"port": 70000}})");
  assert(config_error_key([&] { load_settings(bad_port); }) == "server.port");

  const std::string bad_cycles = write_temp(
      "bad_cycles.json", R"({"cycles": {"speed_low": 4, "speed_high": 2}})");
  assert(config_error_key([&] { load_settings(bad_cycles); }) == "speed_low");
  pass("settings file, env overrides and located parse errors");
}

int main() {
  std::cout << "Starting Params Verification..." << std::endl;
  check_defaults();
  check_validation();
  check_engine_validates_first();
  check_merge_json();
  check_files();
  std::cout << "Params OK" << std::endl;
  return 0;
}
