#include "core/CycleSummarizer.hpp"
#include "core/TrackUtils.hpp"
#include "models/TrackErrors.hpp"

#include <algorithm>
#include <numeric>

CyclePhases CycleSummarizer::split_phases(const std::vector<KinematicPoint> &pts,
                                          const Cycle &c,
                                          const Zone &dump) const {
  CyclePhases ph;
  std::size_t arrive = c.start_index;
  bool found = false;
  for (std::size_t i = c.start_index; i <= c.end_index; ++i) {
    if (TrackUtils::in_zone(pts[i].coord, dump)) {
      arrive = i;
      found = true;
      break;
    }
  }
  if (!found)
    return ph;

  // first visit only: leave at the last point of the in-zone run
  std::size_t depart = arrive;
  while (depart + 1 <= c.end_index &&
         TrackUtils::in_zone(pts[depart + 1].coord, dump))
    ++depart;

  ph.reached_dump = true;
  ph.haul_s = pts[arrive].time - pts[c.start_index].time;
  ph.dump_s = pts[depart].time - pts[arrive].time;
  ph.return_s = pts[c.end_index].time - pts[depart].time;
  return ph;
}

CycleSummaryRow
CycleSummarizer::summarize_cycle(const std::vector<KinematicPoint> &pts,
                                 const Cycle &c) const {
  CycleSummaryRow row;
  row.cycle_id = c.id;
  row.start_time = c.start_time;
  row.end_time = c.end_time;
  // the values the post-filter was applied to
  row.duration_s = c.duration_s;
  row.distance_m = c.distance_m;

  double vmax = 0.0;
  for (std::size_t i = c.start_index; i <= c.end_index; ++i)
    vmax = std::max(vmax, pts[i].speed);
  row.avg_speed_m_s =
      row.duration_s > 0.0 ? row.distance_m / row.duration_s : 0.0;
  row.max_speed_m_s = vmax;
  row.pause_count = c.pause_count;
  row.moving_time_s = c.moving_time_s;

  if (P.dump_zone)
    row.phases = split_phases(pts, c, *P.dump_zone);
  if (P.load_zone)
    row.starts_in_load_zone =
        TrackUtils::in_zone(pts[c.start_index].coord, *P.load_zone);
  return row;
}

TrackAggregates
CycleSummarizer::aggregate(const TrackSignal &signal,
                           const std::vector<CycleSummaryRow> &rows) {
  TrackAggregates agg;
  agg.track_uid = TrackUtils::track_fingerprint(signal.points);
  agg.point_count = signal.points.size();
  agg.dropped_points = signal.stats.dropped_non_monotonic;
  if (!signal.points.empty())
    agg.track_duration_s =
        signal.points.back().time - signal.points.front().time;

  agg.total_cycles = rows.size();
  if (!rows.empty()) {
    std::vector<double> durations;
    durations.reserve(rows.size());
    for (const auto &r : rows) {
      durations.push_back(r.duration_s);
      agg.total_cycle_distance_m += r.distance_m;
    }
    agg.total_cycle_time_s =
        std::accumulate(durations.begin(), durations.end(), 0.0);
    agg.mean_duration_s = agg.total_cycle_time_s / durations.size();
    agg.median_duration_s = TrackUtils::median(durations);
    agg.min_duration_s = *std::min_element(durations.begin(), durations.end());
    agg.max_duration_s = *std::max_element(durations.begin(), durations.end());
  }
  agg.idle_time_s = std::max(0.0, agg.track_duration_s - agg.total_cycle_time_s);
  return agg;
}

CycleReport CycleSummarizer::summarize(const TrackSignal &signal,
                                       const std::vector<Cycle> &cycles,
                                       std::vector<AnnotatedPoint> annotated) const {
  if (cycles.empty() && P.require_cycles)
    throw EmptyCycleSetError("no cycles detected in " +
                             std::to_string(signal.points.size()) +
                             " points");

  CycleReport report;
  report.rows.reserve(cycles.size());
  for (const auto &c : cycles)
    report.rows.push_back(summarize_cycle(signal.points, c));
  report.points = std::move(annotated);
  report.aggregates = aggregate(signal, report.rows);
  return report;
}
