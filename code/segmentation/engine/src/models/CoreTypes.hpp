#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

// Basic spatial coordinate with elevation.
struct Coordinate {
  double lat;
  double lon;
  double elv;
};

// One decoded track fix. Time is UTC epoch seconds (fractional allowed).
struct PointRecord {
  double time = 0.0;
  double lat = 0.0;
  double lon = 0.0;
  std::optional<double> elevation;
};

enum class MotionLabel : uint8_t { Stationary = 0, Moving = 1 };

inline const char *MotionLabelToString(MotionLabel l) {
  return l == MotionLabel::Moving ? "moving" : "stationary";
}

// A single retained fix with derived kinematics.
struct KinematicPoint {
  Coordinate coord;         // raw location (elv = 0 when absent)
  bool has_elevation = false;
  std::size_t source_index = 0; // index in the raw PointRecord sequence
  double time = 0.0;            // UTC epoch seconds
  double time_rel = 0.0;        // seconds from point 0

  // Derived quantities
  double time_delta_s = 0.0;
  double dist_from_prev_m = 0.0;
  double cum_dist = 0.0;    // cumulative distance in metres
  double speed = 0;         // m/s, 0 for the first point
  double speed_smoothed = 0;
  double heading_radians = 0.0;
  double heading_delta = 0.0; // wrapped to (-pi, pi]
};

// Counters collected while normalising a raw track.
struct NormalizeStats {
  std::size_t input_points = 0;
  std::size_t kept_points = 0;
  std::size_t dropped_non_monotonic = 0;
  std::size_t gap_count = 0;
  double largest_gap_s = 0.0;
};

// Convenience container for a full normalised track.
struct TrackSignal {
  std::vector<KinematicPoint> points;
  NormalizeStats stats;
};
