#include "http_handler.hpp"
#include "core/CycleDB.hpp"
#include "core/CycleEngine.hpp"
#include "core/PointNormalizer.hpp"
#include "core/TrackUtils.hpp"
#include "httplib.h"
#include "infra/MySQLCycleDB.hpp"
#include "io/FileStore.hpp"
#include "io/GpxReader.hpp"
#include "models/ReportJson.hpp"
#include "models/TrackErrors.hpp"
#include "viz/ChartData.hpp"
#include "viz/ChartHtml.hpp"
#include <nlohmann/json.hpp>

#include <algorithm> // sort
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <vector>

using json = nlohmann::json;
namespace fs = std::filesystem;

static void send_error(httplib::Response &res, int status,
                       const std::string &kind, const std::string &msg) {
  res.status = status;
  res.set_content(json{{"ok", false}, {"kind", kind}, {"error", msg}}.dump(),
                  "application/json");
}

// Runs `fn`, mapping the pipeline errors to 400 JSON. Anything else
// propagates to the route lambda in main (500).
template <typename Fn>
static void with_pipeline_errors(httplib::Response &res, Fn &&fn) {
  try {
    fn();
  } catch (const ConfigurationError &e) {
    send_error(res, 400, "configuration", e.what());
  } catch (const MalformedTrackError &e) {
    send_error(res, 400, "malformed_track", e.what());
  } catch (const EmptyCycleSetError &e) {
    send_error(res, 400, "empty_cycle_set", e.what());
  }
}

// ===== routes =====

void HttpHandler::callPostHandler(std::string action,
                                  const httplib::Request &req,
                                  httplib::Response &res) {
  if (action == "upload") {
    handleUpload(req, res);
  } else if (action == "cycles") {
    handleCycles(req, res);
  } else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

void HttpHandler::callGetHandler(std::string action,
                                 const httplib::Request &req,
                                 httplib::Response &res) {
  if (action == "view") {
    handleView(req, res);
  } else if (action == "dbping") {
    handleDBPing(req, res);
  }
  // default
  else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

// keep it to files under the upload dir
bool HttpHandler::isSafeTrackPath(const std::string &s) const {
  for (char c : s) {
    if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' ||
          c == '-' || c == '/'))
      return false;
  }
  if (s.find("..") != std::string::npos)
    return false;
  return s.rfind(settings_.server.upload_dir + "/", 0) == 0;
}

// ===== POST: /upload =====
// Body is raw GPX. Stored content-addressed by the track fingerprint so the
// same track uploaded twice maps to one file.

void HttpHandler::handleUpload(const httplib::Request &req,
                               httplib::Response &res) {
  with_pipeline_errors(res, [&] {
    GpxTrack gpx = GpxReader::parse(req.body);
    PointNormalizer normalizer;
    TrackSignal signal = normalizer.build(gpx.points, settings_.cycles);
    const std::string uid = TrackUtils::track_fingerprint(signal.points);

    std::error_code ec;
    fs::create_directories(settings_.server.upload_dir, ec);
    if (ec) {
      send_error(res, 500, "storage", "cannot create upload dir: " +
                                          ec.message());
      return;
    }

    const std::string filename =
        settings_.server.upload_dir + "/track_" + uid + ".gpx";
    try {
      store_file(filename, req.body);
    } catch (const std::runtime_error &e) {
      std::cerr << "[upload] " << e.what() << "\n";
      send_error(res, 500, "storage", e.what());
      return;
    }

    std::cout << "[upload] " << filename << " points=" << gpx.points.size()
              << " skipped=" << gpx.skipped << "\n";
    json ok = {{"ok", true},
               {"file", filename},
               {"track_uid", uid},
               {"points", gpx.points.size()},
               {"skipped", gpx.skipped}};
    res.set_content(ok.dump(), "application/json");
  });
}

// ===== POST: /cycles =====
// {track: "uploads/track_<uid>.gpx", params?: {...}, persist?: bool,
//  points?: bool}

void HttpHandler::handleCycles(const httplib::Request &req,
                               httplib::Response &res) {
  json in;
  try {
    in = json::parse(req.body);
  } catch (const json::parse_error &e) {
    send_error(res, 400, "bad_request", std::string("invalid json: ") +
                                            e.what());
    return;
  }
  if (!in.is_object() || !in.contains("track") || !in["track"].is_string()) {
    send_error(res, 400, "bad_request", "missing 'track'");
    return;
  }
  const std::string track = in["track"].get<std::string>();
  if (!isSafeTrackPath(track)) {
    send_error(res, 400, "bad_request", "bad track path");
    return;
  }
  if (!fs::exists(track)) {
    send_error(res, 404, "not_found", "file not found: " + track);
    return;
  }
  const bool persist = in.value("persist", false);
  const bool with_points = in.value("points", true);

  with_pipeline_errors(res, [&] {
    CycleParams params = settings_.cycles;
    if (in.contains("params") && in["params"].is_object())
      params.merge_json(in["params"]);

    GpxTrack gpx = GpxReader::read_file(track);
    CycleEngine engine(params);
    CycleAnalysis a = engine.process(gpx.points);

    json out;
    out["ok"] = true;
    out["track"] = track;
    out["params"] = params;
    out["normalize"] = a.signal.stats;
    out["gpx_skipped"] = gpx.skipped;
    out["candidates"] = a.candidates.size();
    out["report"] = report_to_json(a.report, with_points);
    out["charts"] = build_chart_data(a.report, params);

    if (persist) {
      if (!settings_.db.enabled) {
        out["db_error"] = "persistence is disabled in settings";
      } else {
        try {
          MySQLCycleDB db(settings_.db.uri(), settings_.db.user,
                          settings_.db.password, settings_.db.schema);
          persist_report(db, a.report);
          out["persisted"] = true;
        } catch (const std::exception &e) {
          std::cerr << "[DB ERROR] " << e.what() << "\n";
          out["persisted"] = false;
          out["db_error"] = e.what();
        }
      }
    }
    res.set_content(out.dump(), "application/json");
  });
}

// ===== GET: /view =====

void HttpHandler::handleView(const httplib::Request &req,
                             httplib::Response &res) {
  if (!req.has_param("track")) {
    res.status = 400;
    res.set_content("Missing ?track=" + settings_.server.upload_dir +
                        "/<file>.gpx",
                    "text/plain");
    return;
  }
  std::string path = req.get_param_value("track");
  if (!isSafeTrackPath(path)) {
    res.status = 400;
    res.set_content("Bad track path", "text/plain");
    return;
  }
  if (!fs::exists(path)) {
    res.status = 404;
    res.set_content("File not found", "text/plain");
    return;
  }

  try {
    GpxTrack gpx = GpxReader::read_file(path);
    CycleEngine engine(settings_.cycles);
    CycleAnalysis a = engine.process(gpx.points);
    json chart = build_chart_data(a.report, settings_.cycles);
    res.set_content(render_chart_html(chart, a.report.aggregates,
                                      "Haul cycles: " +
                                          fs::path(path).filename().string()),
                    "text/html");
  } catch (const MalformedTrackError &e) {
    res.status = 400;
    res.set_content(std::string("Cannot analyse track: ") + e.what(),
                    "text/plain");
  } catch (const EmptyCycleSetError &e) {
    res.status = 400;
    res.set_content(std::string("No cycles: ") + e.what(), "text/plain");
  }
}

// ===== GET: /dbping =====

void HttpHandler::handleDBPing(const httplib::Request &,
                               httplib::Response &res) {
  const DbSettings &d = settings_.db;
  try {
    MySQLCycleDB db(d.uri(), d.user, d.password, d.schema);
    db.ping();
  } catch (const std::runtime_error &e) {
    std::cerr << "[DB ERROR] ping: " << e.what() << "\n";
    res.status = 500;
    res.set_content(json{{"ok", false}, {"error", e.what()}}.dump(),
                    "application/json");
    return;
  }
  res.set_content(R"({"ok":true,"message":"DB connection successful"})",
                  "application/json");
}

// ===== uploads listing =====

json list_uploads_json(const std::string &dir) {
  json arr = json::array();
  std::error_code ec;
  if (!fs::exists(dir, ec))
    return arr;

  // newest first
  std::vector<fs::directory_entry> entries;
  for (auto &de : fs::directory_iterator(dir, ec)) {
    // stored uploads only; "<name>.gpx.part" is a write in progress
    if (de.is_regular_file() && de.path().extension() == ".gpx")
      entries.push_back(de);
  }
  std::sort(entries.begin(), entries.end(), [](auto &a, auto &b) {
    return fs::last_write_time(a) > fs::last_write_time(b);
  });

  for (auto &de : entries) {
    const auto p = de.path();
    const auto bytes = (uint64_t)fs::file_size(p);
    const auto rel = (fs::path(dir) / p.filename())
                         .generic_string(); // e.g. "uploads/track_....gpx"
    json j{{"file", rel}, // <- value to POST back as "track"
           {"name", p.filename().string()},
           {"bytes", bytes}};
    arr.push_back(j);
  }
  return arr;
}
