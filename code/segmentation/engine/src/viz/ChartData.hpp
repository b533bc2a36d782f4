#pragma once
#include "models/CycleModel.hpp"
#include "models/params.hpp"
#include <nlohmann/json.hpp>

// Plot-ready series for the three cycle views:
//   gantt : one bar per cycle {cycle_id, start, end, duration_min}
//   speed : per cycle {cycle_id, time[], kmh[]}
//   map   : per cycle {cycle_id, lat[], lon[]}, the idle points, and the
//           configured zones
nlohmann::json build_chart_data(const CycleReport &report,
                                const CycleParams &params);
