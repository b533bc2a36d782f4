#pragma once

#include "models/TrackErrors.hpp"
#include <cmath>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <type_traits>

// Circular area such as a load pad or dump point.
struct Zone {
  double lat = 0.0;
  double lon = 0.0;
  double radius_m = 100.0;

  static Zone from_json(const nlohmann::json &j) {
    Zone z;
    z.lat = j.at("lat").get<double>();
    z.lon = j.at("lon").get<double>();
    if (j.contains("radius_m"))
      z.radius_m = j.at("radius_m").get<double>();
    return z;
  }
};

// User-supplied parameters controlling cycle detection.
struct CycleParams {
  double speed_high = 1.0; // m/s, stationary -> moving
  double speed_low = 0.3;  // m/s, moving -> stationary (after dwell)
  double min_dwell_s = 3.0;
  double min_idle_duration_s = 60.0;
  double min_cycle_duration_s = 60.0;
  double min_cycle_distance_m = 50.0;
  int speed_median_window = 1; // 1 = no smoothing
  double max_gap_s = 60.0;
  bool require_cycles = false;
  std::optional<Zone> load_zone;
  std::optional<Zone> dump_zone;
  std::string output_prefix;

  // Overlay any keys present in `j` on top of the current values.
  void merge_json(const nlohmann::json &j) {
    auto upd = [&](const char *key, auto &field) {
      if (!j.contains(key))
        return;
      try {
        field = j.at(key).get<std::decay_t<decltype(field)>>();
      } catch (const nlohmann::json::exception &e) {
        throw ConfigurationError(key, std::string("bad value for '") + key +
                                          "': " + e.what());
      }
    };
    upd("speed_high", speed_high);
    upd("speed_low", speed_low);
    upd("min_dwell_s", min_dwell_s);
    upd("min_idle_duration_s", min_idle_duration_s);
    upd("min_cycle_duration_s", min_cycle_duration_s);
    upd("min_cycle_distance_m", min_cycle_distance_m);
    upd("speed_median_window", speed_median_window);
    upd("max_gap_s", max_gap_s);
    upd("require_cycles", require_cycles);
    upd("output_prefix", output_prefix);

    auto zone = [&](const char *key, std::optional<Zone> &field) {
      if (!j.contains(key))
        return;
      if (j.at(key).is_null()) {
        field.reset();
        return;
      }
      try {
        field = Zone::from_json(j.at(key));
      } catch (const nlohmann::json::exception &e) {
        throw ConfigurationError(key, std::string("bad zone '") + key +
                                          "': " + e.what());
      }
    };
    zone("load_zone", load_zone);
    zone("dump_zone", dump_zone);
  }

  static CycleParams from_json(const nlohmann::json &j) {
    CycleParams p;
    p.merge_json(j);
    return p;
  }

  // Throws ConfigurationError naming the first offending key.
  void validate() const {
    auto non_negative = [](const char *key, double v) {
      if (!std::isfinite(v) || v < 0.0)
        throw ConfigurationError(key, std::string(key) +
                                          " must be a finite value >= 0");
    };
    non_negative("speed_high", speed_high);
    non_negative("speed_low", speed_low);
    non_negative("min_dwell_s", min_dwell_s);
    non_negative("min_idle_duration_s", min_idle_duration_s);
    non_negative("min_cycle_duration_s", min_cycle_duration_s);
    non_negative("min_cycle_distance_m", min_cycle_distance_m);
    non_negative("max_gap_s", max_gap_s);
    if (speed_low >= speed_high)
      throw ConfigurationError(
          "speed_low", "speed_low (" + std::to_string(speed_low) +
                           ") must be below speed_high (" +
                           std::to_string(speed_high) + ")");
    if (speed_median_window < 1)
      throw ConfigurationError("speed_median_window",
                               "speed_median_window must be >= 1");

    auto check_zone = [](const char *key, const std::optional<Zone> &z) {
      if (!z)
        return;
      if (!(z->radius_m > 0.0) || !std::isfinite(z->radius_m))
        throw ConfigurationError(key, std::string(key) +
                                          ".radius_m must be positive");
      if (!(z->lat >= -90.0 && z->lat <= 90.0) ||
          !(z->lon >= -180.0 && z->lon <= 180.0))
        throw ConfigurationError(key, std::string(key) +
                                          " centre is not a valid lat/lon");
    };
    check_zone("load_zone", load_zone);
    check_zone("dump_zone", dump_zone);
  }
};
