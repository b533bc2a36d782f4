// CycleSegmenter: labelled points -> cycle intervals.
//
// IDLE -> IN_CYCLE on the first MOVING point. Inside a cycle every point is
// accumulated; a STATIONARY run only ends the cycle once it lasts
// min_idle_duration_s, and the cycle then ends on the point just before that
// run so idle time is never counted. Filtering by duration/distance is a
// separate pass over the candidates.

#include "core/CycleSegmenter.hpp"

#include <stdexcept>
#include <string>

Cycle CycleSegmenter::make_cycle(const std::vector<KinematicPoint> &pts,
                                 std::size_t a, std::size_t b,
                                 const SegmenterState &state) {
  Cycle c;
  c.start_index = a;
  c.end_index = b;
  c.start_time = pts[a].time;
  c.end_time = pts[b].time;
  c.duration_s = c.end_time - c.start_time;
  c.distance_m = pts[b].cum_dist - pts[a].cum_dist;
  c.pause_count = state.pause_count;
  c.moving_time_s = state.moving_time_s;
  return c;
}

std::optional<Cycle>
CycleSegmenter::step(SegmenterState &state, std::size_t i,
                     const std::vector<KinematicPoint> &pts,
                     const std::vector<MotionLabel> &labels) const {
  const bool moving = labels[i] == MotionLabel::Moving;

  switch (state.phase) {
  case SegmenterPhase::Terminal:
    return std::nullopt;

  case SegmenterPhase::Idle:
    if (moving) {
      state.phase = SegmenterPhase::InCycle;
      state.cycle_start = i;
      state.idle_run_start.reset();
      state.idle_run_length_s = 0.0;
      state.pause_count = 0;
      state.moving_time_s = 0.0;
    }
    return std::nullopt;

  case SegmenterPhase::InCycle:
    if (moving) {
      if (state.idle_run_start) {
        // the stop was only a pause (load/dump)
        ++state.pause_count;
        state.idle_run_start.reset();
        state.idle_run_length_s = 0.0;
      }
      if (i > state.cycle_start)
        state.moving_time_s += pts[i].time_delta_s;
      return std::nullopt;
    }

    if (!state.idle_run_start)
      state.idle_run_start = i;
    state.idle_run_length_s = pts[i].time - pts[*state.idle_run_start].time;
    if (state.idle_run_length_s >= P.min_idle_duration_s) {
      // idle_run_start > cycle_start because the cycle opened on a MOVING
      // point, so the end is inside the cycle
      Cycle c = make_cycle(pts, state.cycle_start, *state.idle_run_start - 1,
                           state);
      state.phase = SegmenterPhase::Idle;
      state.idle_run_start.reset();
      state.idle_run_length_s = 0.0;
      state.pause_count = 0;
      state.moving_time_s = 0.0;
      return c;
    }
    return std::nullopt;
  }
  return std::nullopt;
}

std::optional<Cycle>
CycleSegmenter::finish(SegmenterState &state,
                       const std::vector<KinematicPoint> &pts) const {
  std::optional<Cycle> out;
  if (state.phase == SegmenterPhase::InCycle && !pts.empty())
    out = make_cycle(pts, state.cycle_start, pts.size() - 1, state);
  state.phase = SegmenterPhase::Terminal;
  state.idle_run_start.reset();
  return out;
}

std::vector<Cycle> CycleSegmenter::segment_candidates(
    const std::vector<KinematicPoint> &pts,
    const std::vector<MotionLabel> &labels) const {
  if (labels.size() != pts.size())
    throw std::invalid_argument("segment_candidates: " +
                                std::to_string(labels.size()) +
                                " labels for " + std::to_string(pts.size()) +
                                " points");
  std::vector<Cycle> out;
  SegmenterState state;
  for (std::size_t i = 0; i < pts.size(); ++i) {
    if (auto c = step(state, i, pts, labels))
      out.push_back(*c);
  }
  if (auto c = finish(state, pts))
    out.push_back(*c);
  int id = 0;
  for (auto &c : out)
    c.id = ++id;
  return out;
}

std::vector<Cycle>
CycleSegmenter::filter_candidates(const std::vector<Cycle> &candidates) const {
  std::vector<Cycle> kept;
  kept.reserve(candidates.size());
  for (const auto &c : candidates) {
    if (c.duration_s < P.min_cycle_duration_s)
      continue;
    if (c.distance_m < P.min_cycle_distance_m)
      continue;
    kept.push_back(c);
  }
  int id = 0;
  for (auto &c : kept)
    c.id = ++id;
  return kept;
}

std::vector<AnnotatedPoint>
CycleSegmenter::annotate(const std::vector<KinematicPoint> &pts,
                         const std::vector<MotionLabel> &labels,
                         const std::vector<Cycle> &cycles) {
  std::vector<AnnotatedPoint> out;
  out.reserve(pts.size());
  std::size_t ci = 0;
  for (std::size_t i = 0; i < pts.size(); ++i) {
    const KinematicPoint &p = pts[i];
    AnnotatedPoint a;
    a.index = i;
    a.time = p.time;
    a.lat = p.coord.lat;
    a.lon = p.coord.lon;
    if (p.has_elevation)
      a.elevation = p.coord.elv;
    a.time_delta_s = p.time_delta_s;
    a.dist_from_prev_m = p.dist_from_prev_m;
    a.cum_dist = p.cum_dist;
    a.speed = p.speed;
    a.motion = i < labels.size() ? labels[i] : MotionLabel::Stationary;

    // cycles are ordered and disjoint: one forward sweep
    while (ci < cycles.size() && cycles[ci].end_index < i)
      ++ci;
    if (ci < cycles.size() && cycles[ci].start_index <= i)
      a.cycle_id = cycles[ci].id;
    out.push_back(a);
  }
  return out;
}
