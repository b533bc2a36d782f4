#include "viz/ChartData.hpp"
#include "io/TimeFormat.hpp"

#include <map>

using json = nlohmann::json;

static json zone_marker(const char *name, const Zone &z) {
  return json{{"name", name},
              {"lat", z.lat},
              {"lon", z.lon},
              {"radius_m", z.radius_m}};
}

json build_chart_data(const CycleReport &report, const CycleParams &params) {
  json gantt = json::array();
  for (const auto &r : report.rows) {
    gantt.push_back({{"cycle_id", r.cycle_id},
                     {"start", format_iso8601(r.start_time)},
                     {"end", format_iso8601(r.end_time)},
                     {"duration_min", r.duration_s / 60.0}});
  }

  // points are grouped by cycle id, preserving time order inside a cycle
  std::map<int, json> speed_by_cycle;
  std::map<int, json> path_by_cycle;
  json idle = {{"lat", json::array()}, {"lon", json::array()}};

  for (const auto &p : report.points) {
    if (!p.cycle_id) {
      idle["lat"].push_back(p.lat);
      idle["lon"].push_back(p.lon);
      continue;
    }
    const int id = *p.cycle_id;
    auto &s = speed_by_cycle[id];
    if (s.is_null())
      s = {{"cycle_id", id}, {"time", json::array()}, {"kmh", json::array()}};
    s["time"].push_back(format_iso8601(p.time));
    s["kmh"].push_back(p.speed * 3.6);

    auto &m = path_by_cycle[id];
    if (m.is_null())
      m = {{"cycle_id", id}, {"lat", json::array()}, {"lon", json::array()}};
    m["lat"].push_back(p.lat);
    m["lon"].push_back(p.lon);
  }

  json speed = json::array();
  for (auto &kv : speed_by_cycle)
    speed.push_back(std::move(kv.second));
  json paths = json::array();
  for (auto &kv : path_by_cycle)
    paths.push_back(std::move(kv.second));

  json zones = json::array();
  if (params.load_zone)
    zones.push_back(zone_marker("load", *params.load_zone));
  if (params.dump_zone)
    zones.push_back(zone_marker("dump", *params.dump_zone));

  return json{{"gantt", gantt},
              {"speed", speed},
              {"map", {{"cycles", paths}, {"idle", idle}, {"zones", zones}}}};
}
