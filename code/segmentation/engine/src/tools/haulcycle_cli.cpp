// haulcycle: GPX track -> cycle_summary.csv, points_with_cycles.csv and
// cycles_report.html.
//
// Exit codes: 0 ok, 1 other failure, 2 configuration / usage,
// 3 malformed track, 4 no cycles with --require-cycles.

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>

#include "core/CycleEngine.hpp"
#include "core/Settings.hpp"
#include "io/CsvWriter.hpp"
#include "io/GpxReader.hpp"
#include "io/TimeFormat.hpp"
#include "models/ReportJson.hpp"
#include "models/TrackErrors.hpp"
#include "viz/ChartData.hpp"
#include "viz/ChartHtml.hpp"

using json = nlohmann::json;

// ultra-light arg parser
struct Options {
  std::string gpx;    // --gpx track.gpx
  std::string prefix; // --prefix out/run1_
  bool has_prefix = false;
  std::string config; // --config settings.json
  json set_keys = json::object(); // only the flags actually given
  bool no_html = false;   // --no-html
  bool print_json = false; // --json
  bool verbose = false;   // --verbose
  bool help = false;
};

static const char *kUsage =
    "Usage: haulcycle --gpx <file.gpx> [--prefix <p>] [--config <json>]\n"
    "                 [--speed-high m/s] [--speed-low m/s] [--min-dwell s]\n"
    "                 [--min-idle s] [--min-cycle-duration s]\n"
    "                 [--min-cycle-distance m] [--require-cycles]\n"
    "                 [--no-html] [--json] [--verbose]\n";

static Options parse(int argc, char **argv) {
  Options o;
  for (int i = 1; i < argc; i++) {
    std::string a(argv[i]);
    auto nexts = [&](std::string &tgt) {
      if (i + 1 >= argc)
        throw ConfigurationError(a, "missing value after " + a);
      tgt = argv[++i];
    };
    auto next = [&](const char *key) {
      std::string v;
      nexts(v);
      try {
        std::size_t used = 0;
        double d = std::stod(v, &used);
        if (used != v.size())
          throw std::invalid_argument(v);
        o.set_keys[key] = d;
      } catch (const std::logic_error &) {
        throw ConfigurationError(key, a + " expects a number, got '" + v + "'");
      }
    };
    if (a == "--gpx")
      nexts(o.gpx);
    else if (a == "--prefix") {
      nexts(o.prefix);
      o.has_prefix = true;
    } else if (a == "--config")
      nexts(o.config);
    else if (a == "--speed-high")
      next("speed_high");
    else if (a == "--speed-low")
      next("speed_low");
    else if (a == "--min-dwell")
      next("min_dwell_s");
    else if (a == "--min-idle")
      next("min_idle_duration_s");
    else if (a == "--min-cycle-duration")
      next("min_cycle_duration_s");
    else if (a == "--min-cycle-distance")
      next("min_cycle_distance_m");
    else if (a == "--require-cycles")
      o.set_keys["require_cycles"] = true;
    else if (a == "--no-html")
      o.no_html = true;
    else if (a == "--json")
      o.print_json = true;
    else if (a == "--verbose")
      o.verbose = true;
    else if (a == "--help" || a == "-h")
      o.help = true;
    else
      throw ConfigurationError(a, "unknown argument: " + a);
  }
  return o;
}

static void print_summary(const CycleReport &r) {
  std::cout << "Cycle Summary:\n";
  if (r.rows.empty()) {
    std::cout << "  (no cycles detected)\n";
  } else {
    std::printf("  %5s  %-24s  %-24s  %9s  %11s  %9s\n", "cycle", "start_time",
                "end_time", "dur_min", "distance_m", "avg_km/h");
    for (const auto &row : r.rows)
      std::printf("  %5d  %-24s  %-24s  %9.2f  %11.1f  %9.2f\n", row.cycle_id,
                  format_iso8601(row.start_time).c_str(),
                  format_iso8601(row.end_time).c_str(), row.duration_s / 60.0,
                  row.distance_m, row.avg_speed_m_s * 3.6);
  }
  const TrackAggregates &a = r.aggregates;
  std::printf("  total=%zu  mean=%.2f min  median=%.2f min  idle=%.2f min\n",
              a.total_cycles, a.mean_duration_s / 60.0,
              a.median_duration_s / 60.0, a.idle_time_s / 60.0);
  std::fflush(stdout);
}

static int run(const Options &opt) {
  // 1) parameters: defaults <- config file <- flags
  CycleParams params;
  if (!opt.config.empty())
    params = load_params_file(opt.config, params);
  params.merge_json(opt.set_keys);
  if (opt.has_prefix)
    params.output_prefix = opt.prefix;
  params.validate();

  // 2) track
  GpxTrack gpx = GpxReader::read_file(opt.gpx);
  std::cout << "[haulcycle] Loaded " << gpx.points.size() << " points from "
            << opt.gpx;
  if (gpx.skipped > 0)
    std::cout << " (" << gpx.skipped << " skipped)";
  std::cout << "\n";

  // 3) pipeline
  CycleEngine engine(params, opt.verbose);
  CycleAnalysis a = engine.process(gpx.points);
  print_summary(a.report);

  // 4) outputs
  for (const auto &path : CsvWriter::write_report(a.report, params.output_prefix))
    std::cout << "[haulcycle] wrote " << path << "\n";
  if (!opt.no_html) {
    const std::string html_path = chart_html_path(params.output_prefix);
    write_chart_html(html_path,
                     render_chart_html(build_chart_data(a.report, params),
                                       a.report.aggregates,
                                       "Haul cycles: " + opt.gpx));
    std::cout << "[haulcycle] wrote " << html_path << "\n";
  }
  if (opt.print_json)
    std::cout << report_to_json(a.report, false).dump(2) << "\n";
  return 0;
}

int main(int argc, char **argv) {
  Options opt;
  try {
    opt = parse(argc, argv);
  } catch (const ConfigurationError &e) {
    std::cerr << "[ERROR] " << e.what() << "\n" << kUsage;
    return 2;
  }
  if (opt.help) {
    std::cout << kUsage;
    return 0;
  }
  if (opt.gpx.empty()) {
    std::cerr << kUsage;
    return 2;
  }

  try {
    return run(opt);
  } catch (const ConfigurationError &e) {
    std::cerr << "[ERROR] configuration (" << e.key() << "): " << e.what()
              << "\n";
    return 2;
  } catch (const MalformedTrackError &e) {
    std::cerr << "[ERROR] malformed track: " << e.what();
    if (e.index())
      std::cerr << " [index " << *e.index() << "]";
    std::cerr << "\n";
    return 3;
  } catch (const EmptyCycleSetError &e) {
    std::cerr << "[ERROR] " << e.what() << "\n";
    return 4;
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] " << e.what() << "\n";
    return 1;
  }
}
