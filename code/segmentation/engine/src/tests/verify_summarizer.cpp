#include "core/CycleEngine.hpp"
#include "core/CycleSummarizer.hpp"
#include "io/CsvWriter.hpp"
#include "models/TrackErrors.hpp"
#include "track_fixtures.hpp"
#include <cassert>
#include <cctype>
#include <iostream>
#include <sstream>

using namespace fixtures;

static CycleParams scenario_params() {
  CycleParams p;
  p.min_idle_duration_s = 5.0;
  p.min_cycle_duration_s = 10.0;
  p.min_cycle_distance_m = 10.0;
  return p;
}

static void check_rows() {
  CycleEngine engine(scenario_params());
  CycleReport r = engine.process(two_cycle_track()).report;
  assert(r.rows.size() == 2);

  const CycleSummaryRow &a = r.rows[0];
  assert(a.cycle_id == 1);
  assert(near(a.start_time, kT0 + 10) && near(a.end_time, kT0 + 40));
  assert(near(a.duration_s, 30.0));
  assert(near(a.distance_m, 150.0, 1e-6));
  assert(near(a.avg_speed_m_s, 5.0, 1e-6));
  assert(near(a.max_speed_m_s, 5.0, 1e-6));
  assert(a.pause_count == 0);
  assert(near(a.moving_time_s, 30.0));
  assert(!a.phases && !a.starts_in_load_zone);

  const CycleSummaryRow &b = r.rows[1];
  assert(b.cycle_id == 2);
  assert(near(b.duration_s, 29.0));
  assert(near(b.distance_m, 145.0, 1e-6));
  pass("per-cycle duration, distance and speeds");
}

static void check_aggregates() {
  CycleEngine engine(scenario_params());
  CycleReport r = engine.process(two_cycle_track()).report;
  const TrackAggregates &g = r.aggregates;
  assert(g.total_cycles == 2);
  assert(near(g.mean_duration_s, 29.5));
  assert(near(g.median_duration_s, 29.5));
  assert(near(g.min_duration_s, 29.0));
  assert(near(g.max_duration_s, 30.0));
  assert(near(g.total_cycle_distance_m, 295.0, 1e-6));
  assert(near(g.total_cycle_time_s, 59.0));
  assert(near(g.track_duration_s, 120.0));
  assert(near(g.idle_time_s, 61.0));
  assert(g.point_count == 121);
  assert(g.dropped_points == 0);

  assert(g.track_uid.size() == 64);
  for (char c : g.track_uid)
    assert(std::isxdigit(static_cast<unsigned char>(c)) &&
           !std::isupper(static_cast<unsigned char>(c)));
  pass("track aggregates and fingerprint");
}

static void check_median_odd() {
  std::vector<CycleSummaryRow> rows(3);
  rows[0].duration_s = 100;
  rows[1].duration_s = 10;
  rows[2].duration_s = 40;
  TrackSignal s;
  s.points.resize(2);
  s.points[1].time = 500;
  TrackAggregates g = CycleSummarizer::aggregate(s, rows);
  assert(near(g.median_duration_s, 40.0));
  assert(near(g.mean_duration_s, 50.0));
  assert(near(g.idle_time_s, 350.0));
  pass("median of an odd count");
}

static void check_empty() {
  auto track = TrackBuilder().hold(30).build();
  CycleEngine engine(scenario_params());
  CycleReport r = engine.process(track).report;
  assert(r.rows.empty());
  assert(r.points.size() == track.size());
  assert(r.aggregates.total_cycles == 0);
  assert(r.aggregates.mean_duration_s == 0.0);
  assert(near(r.aggregates.idle_time_s, 30.0));

  CycleParams strict = scenario_params();
  strict.require_cycles = true;
  bool threw = false;
  try {
    CycleEngine(strict).process(track);
  } catch (const EmptyCycleSetError &) {
    threw = true;
  }
  assert(threw);
  pass("zero cycles: empty tables, or EmptyCycleSetError on request");
}

static void check_phases() {
  // out 300 m north, stop 10 s at the far end, back to the start
  auto track = TrackBuilder().hold(9).move(30, 10.0).hold(10).move(30, -10.0)
                   .hold(40).build();
  CycleParams p = scenario_params();
  p.min_idle_duration_s = 20.0;
  Zone load;
  load.lat = kBaseLat;
  load.lon = kBaseLon;
  load.radius_m = 15.0;
  Zone dump;
  dump.lat = kBaseLat + 300.0 / kMetresPerDegLat;
  dump.lon = kBaseLon;
  dump.radius_m = 15.0;
  p.load_zone = load;
  p.dump_zone = dump;

  CycleEngine engine(p);
  CycleReport r = engine.process(track).report;
  assert(r.rows.size() == 1);
  const CycleSummaryRow &row = r.rows[0];
  assert(row.pause_count == 1);
  assert(row.phases && row.phases->reached_dump);
  assert(near(row.phases->haul_s, 28.0));   // t=10 -> first in-zone t=38
  assert(near(row.phases->dump_s, 12.0));   // t=38 -> last in-zone t=50
  assert(near(row.phases->return_s, 29.0)); // t=50 -> end t=79
  assert(near(row.phases->haul_s + row.phases->dump_s + row.phases->return_s,
              row.duration_s));
  assert(row.starts_in_load_zone && *row.starts_in_load_zone);
  assert(near(row.max_speed_m_s, 10.0, 1e-6));

  // a dump zone never visited
  Zone far = dump;
  far.lat += 0.01;
  p.dump_zone = far;
  CycleReport r2 = CycleEngine(p).process(track).report;
  assert(r2.rows[0].phases && !r2.rows[0].phases->reached_dump);
  pass("load/haul/dump/return split from zones");
}

static void check_idempotent() {
  CycleEngine engine(scenario_params());
  auto track = two_cycle_track();
  CycleReport a = engine.process(track).report;
  CycleReport b = engine.process(track).report;

  std::ostringstream sa, sb, pa, pb;
  CsvWriter::write_summary(sa, a.rows);
  CsvWriter::write_summary(sb, b.rows);
  CsvWriter::write_points(pa, a.points);
  CsvWriter::write_points(pb, b.points);
  assert(sa.str() == sb.str());
  assert(pa.str() == pb.str());
  assert(a.aggregates.track_uid == b.aggregates.track_uid);

  // a different track gives a different fingerprint
  auto other = track;
  other.back().lat += 1e-5;
  CycleReport c = engine.process(other).report;
  assert(c.aggregates.track_uid != a.aggregates.track_uid);
  pass("re-running yields byte-identical tables");
}

int main() {
  std::cout << "Starting CycleSummarizer Verification..." << std::endl;
  check_rows();
  check_aggregates();
  check_median_odd();
  check_empty();
  check_phases();
  check_idempotent();
  std::cout << "CycleSummarizer OK" << std::endl;
  return 0;
}
