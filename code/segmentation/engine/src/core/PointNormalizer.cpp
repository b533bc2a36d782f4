// PointNormalizer: raw fixes -> strictly time-ordered kinematic points.
//
// Samples that do not advance the clock relative to the last kept sample are
// dropped (duplicates keep the first, out-of-order fixes are never
// reordered), then per-point distance, speed, cumulative distance and
// bearing change are derived with the shared haversine.

#include "core/PointNormalizer.hpp"
#include "core/TrackUtils.hpp"
#include "models/TrackErrors.hpp"
#include <algorithm>
#include <cmath>
#include <optional>
#include <string>
#include <vector>

static inline bool valid_coordinate(const PointRecord &r) {
  return std::isfinite(r.lat) && std::isfinite(r.lon) && r.lat >= -90.0 &&
         r.lat <= 90.0 && r.lon >= -180.0 && r.lon <= 180.0;
}

TrackSignal PointNormalizer::build(const std::vector<PointRecord> &records,
                                   const CycleParams &params) const {
  TrackSignal signal;
  signal.stats.input_points = records.size();
  signal.points.reserve(records.size());

  for (std::size_t i = 0; i < records.size(); ++i) {
    const PointRecord &r = records[i];
    if (!std::isfinite(r.time))
      throw MalformedTrackError("point " + std::to_string(i) +
                                    " has a non-finite timestamp",
                                i);
    if (!valid_coordinate(r))
      throw MalformedTrackError("point " + std::to_string(i) +
                                    " has an invalid coordinate (" +
                                    std::to_string(r.lat) + ", " +
                                    std::to_string(r.lon) + ")",
                                i, r.time);

    // zero or negative interval to the last kept sample: drop
    if (!signal.points.empty() && !(r.time > signal.points.back().time)) {
      ++signal.stats.dropped_non_monotonic;
      continue;
    }

    KinematicPoint kp;
    kp.coord = {r.lat, r.lon, r.elevation.value_or(0.0)};
    kp.has_elevation = r.elevation.has_value();
    kp.source_index = i;
    kp.time = r.time;
    signal.points.push_back(kp);
  }

  signal.stats.kept_points = signal.points.size();
  if (signal.points.size() < 2) {
    std::optional<double> ts;
    if (!signal.points.empty())
      ts = signal.points.front().time;
    throw MalformedTrackError(
        "track needs at least 2 usable points, got " +
            std::to_string(signal.points.size()) + " of " +
            std::to_string(records.size()),
        std::nullopt, ts);
  }

  computeKinematics(signal, params);
  return signal;
}

void PointNormalizer::computeKinematics(TrackSignal &signal,
                                        const CycleParams &params) const {
  auto &pts = signal.points;
  const double t0 = pts.front().time;

  // ---------------------------------------------------------------------
  // Distance, speed and cumulative distance. Point 0 has zero speed by
  // convention.
  double acc_m = 0.0;
  for (size_t i = 0; i < pts.size(); ++i) {
    KinematicPoint &p = pts[i];
    p.time_rel = p.time - t0;
    if (i == 0) {
      p.cum_dist = 0.0;
      p.speed = 0.0;
      continue;
    }
    const KinematicPoint &prev = pts[i - 1];
    const double dt = p.time - prev.time; // > 0 after the drop pass
    const double ds = TrackUtils::haversine(prev.coord, p.coord);
    acc_m += ds;
    p.time_delta_s = dt;
    p.dist_from_prev_m = ds;
    p.cum_dist = acc_m;
    p.speed = ds / dt;

    if (dt > params.max_gap_s) {
      ++signal.stats.gap_count;
      signal.stats.largest_gap_s = std::max(signal.stats.largest_gap_s, dt);
    }
  }

  // ---------------------------------------------------------------------
  // Heading and bearing change. A sample that did not move keeps the
  // previous heading so stationary jitter does not register as turning.
  bool have_heading = false;
  for (size_t i = 1; i < pts.size(); ++i) {
    KinematicPoint &p = pts[i];
    if (p.dist_from_prev_m > 1e-3) {
      const double h = TrackUtils::initialBearingRad(pts[i - 1].coord, p.coord);
      p.heading_delta =
          have_heading ? TrackUtils::ang_diff(pts[i - 1].heading_radians, h)
                       : 0.0;
      p.heading_radians = h;
      have_heading = true;
    } else {
      p.heading_radians = pts[i - 1].heading_radians;
      p.heading_delta = 0.0;
    }
  }
  // Samples before the first movement take the first real heading.
  for (size_t i = 1; i < pts.size(); ++i) {
    if (pts[i].dist_from_prev_m > 1e-3) {
      for (size_t k = 0; k < i; ++k)
        pts[k].heading_radians = pts[i].heading_radians;
      break;
    }
  }

  TrackUtils::median_smooth_speed(pts, params.speed_median_window);
}
