#pragma once

#include "models/CoreTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// One operational loop over the kept point sequence.
struct Cycle {
  int id = 0;                 // sequential, starting at 1 after filtering
  std::size_t start_index = 0; // inclusive
  std::size_t end_index = 0;   // inclusive
  double start_time = 0.0;     // UTC epoch seconds
  double end_time = 0.0;
  double duration_s = 0.0;
  double distance_m = 0.0;
  int pause_count = 0; // short stationary pauses kept inside the cycle
  double moving_time_s = 0.0;
};

// Zone-based phase split for one cycle (load -> haul -> dump -> return).
struct CyclePhases {
  bool reached_dump = false;
  double haul_s = 0.0;
  double dump_s = 0.0;
  double return_s = 0.0;
};

// One output row per finalised cycle.
struct CycleSummaryRow {
  int cycle_id = 0;
  double start_time = 0.0;
  double end_time = 0.0;
  double duration_s = 0.0;
  double distance_m = 0.0;
  double avg_speed_m_s = 0.0;
  double max_speed_m_s = 0.0;
  int pause_count = 0;
  double moving_time_s = 0.0;
  std::optional<CyclePhases> phases;       // only with a dump zone
  std::optional<bool> starts_in_load_zone; // only with a load zone
};

// Every kept point with its cycle id (nullopt = idle gap).
struct AnnotatedPoint {
  std::size_t index = 0;
  double time = 0.0;
  double lat = 0.0;
  double lon = 0.0;
  std::optional<double> elevation;
  double time_delta_s = 0.0;
  double dist_from_prev_m = 0.0;
  double cum_dist = 0.0;
  double speed = 0.0;
  MotionLabel motion = MotionLabel::Stationary;
  std::optional<int> cycle_id;
};

// Track-wide aggregates.
struct TrackAggregates {
  std::string track_uid; // SHA-256 hex of the normalised track
  std::size_t total_cycles = 0;
  double mean_duration_s = 0.0;
  double median_duration_s = 0.0;
  double min_duration_s = 0.0;
  double max_duration_s = 0.0;
  double total_cycle_distance_m = 0.0;
  double total_cycle_time_s = 0.0;
  double track_duration_s = 0.0;
  double idle_time_s = 0.0;
  std::size_t point_count = 0;
  std::size_t dropped_points = 0;
};

// Everything the output collaborators consume.
struct CycleReport {
  std::vector<CycleSummaryRow> rows;
  std::vector<AnnotatedPoint> points;
  TrackAggregates aggregates;
};
