#pragma once

#include "io/TimeFormat.hpp"
#include "models/CoreTypes.hpp"
#include "models/CycleModel.hpp"
#include "models/params.hpp"
#include <nlohmann/json.hpp>
#include <vector>

using Json = nlohmann::json;

// to_json() overloads so reports can be dumped with Json(x) / j = x.
// Keys come out sorted (nlohmann::json is map-backed), which keeps the output
// stable between runs.

// ---- Zone / params ----
inline void to_json(Json &j, const Zone &z) {
  j = Json{{"lat", z.lat}, {"lon", z.lon}, {"radius_m", z.radius_m}};
}

inline void to_json(Json &j, const CycleParams &p) {
  j = Json{{"speed_high", p.speed_high},
           {"speed_low", p.speed_low},
           {"min_dwell_s", p.min_dwell_s},
           {"min_idle_duration_s", p.min_idle_duration_s},
           {"min_cycle_duration_s", p.min_cycle_duration_s},
           {"min_cycle_distance_m", p.min_cycle_distance_m},
           {"speed_median_window", p.speed_median_window},
           {"max_gap_s", p.max_gap_s},
           {"require_cycles", p.require_cycles},
           {"output_prefix", p.output_prefix}};
  j["load_zone"] = p.load_zone ? Json(*p.load_zone) : Json(nullptr);
  j["dump_zone"] = p.dump_zone ? Json(*p.dump_zone) : Json(nullptr);
}

// ---- Cycle ----
inline void to_json(Json &j, const Cycle &c) {
  j = Json{{"id", c.id},
           {"start_index", c.start_index},
           {"end_index", c.end_index},
           {"start_time", c.start_time},
           {"end_time", c.end_time},
           {"duration_s", c.duration_s},
           {"distance_m", c.distance_m},
           {"pause_count", c.pause_count},
           {"moving_time_s", c.moving_time_s}};
}

// ---- Summary row ----
inline void to_json(Json &j, const CycleSummaryRow &r) {
  j = Json{{"cycle_id", r.cycle_id},
           {"start_time", format_iso8601(r.start_time)},
           {"end_time", format_iso8601(r.end_time)},
           {"start_epoch", r.start_time},
           {"end_epoch", r.end_time},
           {"duration_s", r.duration_s},
           {"duration_min", r.duration_s / 60.0},
           {"distance_m", r.distance_m},
           {"avg_speed_m_s", r.avg_speed_m_s},
           {"max_speed_m_s", r.max_speed_m_s},
           {"pause_count", r.pause_count},
           {"moving_time_s", r.moving_time_s}};
  if (r.phases) {
    j["reached_dump"] = r.phases->reached_dump;
    if (r.phases->reached_dump) {
      j["haul_s"] = r.phases->haul_s;
      j["dump_s"] = r.phases->dump_s;
      j["return_s"] = r.phases->return_s;
    }
  }
  if (r.starts_in_load_zone)
    j["starts_in_load_zone"] = *r.starts_in_load_zone;
}

// ---- Annotated point ----
inline void to_json(Json &j, const AnnotatedPoint &p) {
  j = Json{{"index", p.index},
           {"time", format_iso8601(p.time)},
           {"lat", p.lat},
           {"lon", p.lon},
           {"speed_m_s", p.speed},
           {"cum_dist_m", p.cum_dist},
           {"motion", MotionLabelToString(p.motion)}};
  j["elevation"] = p.elevation ? Json(*p.elevation) : Json(nullptr);
  j["cycle_id"] = p.cycle_id ? Json(*p.cycle_id) : Json(nullptr);
}

// ---- Aggregates ----
inline void to_json(Json &j, const TrackAggregates &a) {
  j = Json{{"track_uid", a.track_uid},
           {"total_cycles", a.total_cycles},
           {"mean_duration_s", a.mean_duration_s},
           {"median_duration_s", a.median_duration_s},
           {"min_duration_s", a.min_duration_s},
           {"max_duration_s", a.max_duration_s},
           {"total_cycle_distance_m", a.total_cycle_distance_m},
           {"total_cycle_time_s", a.total_cycle_time_s},
           {"track_duration_s", a.track_duration_s},
           {"idle_time_s", a.idle_time_s},
           {"point_count", a.point_count},
           {"dropped_points", a.dropped_points}};
}

inline void to_json(Json &j, const NormalizeStats &s) {
  j = Json{{"input_points", s.input_points},
           {"kept_points", s.kept_points},
           {"dropped_non_monotonic", s.dropped_non_monotonic},
           {"gap_count", s.gap_count},
           {"largest_gap_s", s.largest_gap_s}};
}

// ---- Report ----
// `with_points` = false leaves out the per-point table (large tracks).
inline Json report_to_json(const CycleReport &r, bool with_points = true) {
  Json j;
  j["aggregates"] = r.aggregates;
  j["cycles"] = r.rows;
  if (with_points)
    j["points"] = r.points;
  return j;
}

inline void to_json(Json &j, const CycleReport &r) { j = report_to_json(r); }
