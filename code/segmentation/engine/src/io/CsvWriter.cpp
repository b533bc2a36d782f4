#include "io/CsvWriter.hpp"
#include "io/TimeFormat.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>

// printf-style number formatting; locale independent for the formats used
static std::string fmt(const char *format, double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), format, v);
  return buf;
}

void CsvWriter::write_summary(std::ostream &os,
                              const std::vector<CycleSummaryRow> &rows) {
  os << "cycle_id,start_time,end_time,duration_s,duration_min,distance_m,"
        "avg_speed_m_s,max_speed_m_s,pause_count,moving_time_s,"
        "reached_dump,haul_s,dump_s,return_s,starts_in_load_zone\n";
  for (const auto &r : rows) {
    os << r.cycle_id << ',' << format_iso8601(r.start_time) << ','
       << format_iso8601(r.end_time) << ',' << fmt("%.3f", r.duration_s) << ','
       << fmt("%.3f", r.duration_s / 60.0) << ',' << fmt("%.2f", r.distance_m)
       << ',' << fmt("%.3f", r.avg_speed_m_s) << ','
       << fmt("%.3f", r.max_speed_m_s) << ',' << r.pause_count << ','
       << fmt("%.3f", r.moving_time_s) << ',';
    if (r.phases) {
      os << (r.phases->reached_dump ? "true" : "false") << ',';
      if (r.phases->reached_dump)
        os << fmt("%.3f", r.phases->haul_s) << ','
           << fmt("%.3f", r.phases->dump_s) << ','
           << fmt("%.3f", r.phases->return_s) << ',';
      else
        os << ",,,";
    } else {
      os << ",,,,";
    }
    if (r.starts_in_load_zone)
      os << (*r.starts_in_load_zone ? "true" : "false");
    os << '\n';
  }
}

void CsvWriter::write_points(std::ostream &os,
                             const std::vector<AnnotatedPoint> &points) {
  os << "index,time,lat,lon,elevation,speed_m_s,cum_dist_m,motion,cycle_id\n";
  for (const auto &p : points) {
    os << p.index << ',' << format_iso8601(p.time) << ','
       << fmt("%.6f", p.lat) << ',' << fmt("%.6f", p.lon) << ',';
    if (p.elevation)
      os << fmt("%.2f", *p.elevation);
    os << ',' << fmt("%.3f", p.speed) << ',' << fmt("%.2f", p.cum_dist) << ','
       << MotionLabelToString(p.motion) << ',';
    if (p.cycle_id)
      os << *p.cycle_id;
    os << '\n';
  }
}

std::vector<std::string> CsvWriter::write_report(const CycleReport &report,
                                                 const std::string &prefix) {
  std::vector<std::string> written;

  const std::string sp = summary_path(prefix);
  std::ofstream s(sp, std::ios::binary | std::ios::trunc);
  if (!s)
    throw std::runtime_error("cannot write " + sp);
  write_summary(s, report.rows);
  s.close();
  if (!s)
    throw std::runtime_error("write failed: " + sp);
  written.push_back(sp);

  const std::string pp = points_path(prefix);
  std::ofstream p(pp, std::ios::binary | std::ios::trunc);
  if (!p)
    throw std::runtime_error("cannot write " + pp);
  write_points(p, report.points);
  p.close();
  if (!p)
    throw std::runtime_error("write failed: " + pp);
  written.push_back(pp);

  return written;
}
