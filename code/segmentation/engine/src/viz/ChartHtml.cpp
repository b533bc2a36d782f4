#include "viz/ChartHtml.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>

static std::string html_escape(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
    case '&': out += "&amp;"; break;
    case '<': out += "&lt;"; break;
    case '>': out += "&gt;"; break;
    case '"': out += "&quot;"; break;
    default: out += c;
    }
  }
  return out;
}

// JSON inside <script>: "</" would end the element early
static std::string script_safe(std::string s) {
  std::string::size_type pos = 0;
  while ((pos = s.find("</", pos)) != std::string::npos) {
    s.replace(pos, 2, "<\\/");
    pos += 3;
  }
  return s;
}

std::string render_chart_html(const nlohmann::json &chart,
                              const TrackAggregates &agg,
                              const std::string &title) {
  char stats[256];
  std::snprintf(stats, sizeof(stats),
                "%zu cycle(s), mean %.1f min, median %.1f min, idle %.1f min",
                agg.total_cycles, agg.mean_duration_s / 60.0,
                agg.median_duration_s / 60.0, agg.idle_time_s / 60.0);

  std::string html = R"(<!doctype html><html><head>
<meta charset="utf-8"/>
<title>)" + html_escape(title) + R"(</title>
<script src="https://cdn.plot.ly/plotly-latest.min.js"></script>
<style>
  body{margin:0;font-family:sans-serif}
  h3{margin:8px}
  #stats{margin:0 8px 8px;font:12px/1.4 monospace}
  #gantt{height:30vh;}
  #speed{height:30vh;}
  #map{height:50vh;}
  #empty{padding:16px;font-size:15px;color:#a33}
</style>
</head><body>
<h3>)" + html_escape(title) + R"(</h3>
<div id="stats">)" + html_escape(stats) + R"(</div>
<div id="gantt"></div>
<div id="speed"></div>
<div id="map"></div>
<script>
var CHART = )" + script_safe(chart.dump()) + R"(;

if (CHART.gantt.length === 0) {
  document.getElementById('gantt').outerHTML =
    '<div id="empty">No cycles found in this track.</div>';
} else {
  var bars = CHART.gantt.map(function (g) {
    return {
      type: 'scatter', mode: 'lines', line: {width: 18},
      x: [g.start, g.end], y: ['Cycle ' + g.cycle_id, 'Cycle ' + g.cycle_id],
      name: 'Cycle ' + g.cycle_id,
      hovertext: g.duration_min.toFixed(1) + ' min', showlegend: false
    };
  });
  Plotly.newPlot('gantt', bars, {
    title: 'Gantt Chart of Haul Cycles', xaxis: {type: 'date'},
    yaxis: {autorange: 'reversed'}, margin: {l: 80, r: 20, t: 40, b: 40}
  });
}

if (CHART.speed.length > 0) {
  Plotly.newPlot('speed', CHART.speed.map(function (s) {
    return {type: 'scatter', mode: 'lines', x: s.time, y: s.kmh,
            name: 'Cycle ' + s.cycle_id};
  }), {
    title: 'Speed vs. Time by Cycle', xaxis: {type: 'date'},
    yaxis: {title: 'Speed (km/h)'}, margin: {l: 60, r: 20, t: 40, b: 40}
  });
}

var mapTraces = [];
if (CHART.map.idle.lat.length > 0) {
  mapTraces.push({type: 'scatter', mode: 'markers', x: CHART.map.idle.lon,
                  y: CHART.map.idle.lat, name: 'idle',
                  marker: {size: 3, color: '#bbb'}});
}
CHART.map.cycles.forEach(function (c) {
  mapTraces.push({type: 'scatter', mode: 'lines+markers', x: c.lon, y: c.lat,
                  name: 'Cycle ' + c.cycle_id, marker: {size: 4}});
});
CHART.map.zones.forEach(function (z) {
  mapTraces.push({type: 'scatter', mode: 'markers', x: [z.lon], y: [z.lat],
                  name: z.name + ' zone',
                  marker: {symbol: 'star', size: 16,
                           color: z.name === 'load' ? 'green' : 'red'}});
});
if (mapTraces.length > 0) {
  Plotly.newPlot('map', mapTraces, {
    title: 'Map of Haul Cycles (Lat/Lon)', xaxis: {title: 'Longitude'},
    yaxis: {title: 'Latitude', scaleanchor: 'x'},
    margin: {l: 60, r: 20, t: 40, b: 40}
  });
}
</script>
</body></html>
)";
  return html;
}

void write_chart_html(const std::string &path, const std::string &html) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out)
    throw std::runtime_error("cannot write " + path);
  out << html;
  out.close();
  if (!out)
    throw std::runtime_error("write failed: " + path);
}
