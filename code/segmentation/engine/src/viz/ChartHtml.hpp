#pragma once
#include "models/CycleModel.hpp"
#include <nlohmann/json.hpp>
#include <string>

// Standalone page (Plotly from CDN) with the Gantt, speed and map views.
std::string render_chart_html(const nlohmann::json &chart,
                              const TrackAggregates &agg,
                              const std::string &title);

// <prefix>cycles_report.html
inline std::string chart_html_path(const std::string &prefix) {
  return prefix + "cycles_report.html";
}

// Throws std::runtime_error if the file cannot be written.
void write_chart_html(const std::string &path, const std::string &html);
