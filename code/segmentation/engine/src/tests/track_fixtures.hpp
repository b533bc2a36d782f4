#pragma once
// Synthetic tracks for the verify_* programs. Every track runs due north from
// (40, -105) at 1 Hz so distances along it are exact multiples of the step.

#include "core/TrackUtils.hpp"
#include "models/CoreTypes.hpp"
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace fixtures {

constexpr double kBaseLat = 40.0;
constexpr double kBaseLon = -105.0;
constexpr double kT0 = 1700000000.0; // 2023-11-14T22:13:20Z
const double kMetresPerDegLat = TrackUtils::kEarthRadiusM * M_PI / 180.0;

inline PointRecord at(double t_rel, double north_m) {
  PointRecord r;
  r.time = kT0 + t_rel;
  r.lat = kBaseLat + north_m / kMetresPerDegLat;
  r.lon = kBaseLon;
  return r;
}

// Appends 1 Hz samples: hold() stays put, move() advances v m per second.
class TrackBuilder {
public:
  TrackBuilder() { pts_.push_back(at(0.0, 0.0)); }

  TrackBuilder &hold(int seconds) {
    for (int i = 0; i < seconds; ++i)
      pts_.push_back(at(++t_, pos_));
    return *this;
  }
  TrackBuilder &move(int seconds, double v) {
    for (int i = 0; i < seconds; ++i) {
      pos_ += v;
      pts_.push_back(at(++t_, pos_));
    }
    return *this;
  }
  std::vector<PointRecord> build() const { return pts_; }

private:
  std::vector<PointRecord> pts_;
  double t_ = 0.0;
  double pos_ = 0.0;
};

// t=0..9 parked, 10..40 at 5 m/s, 41..70 parked, 71..100 at 5 m/s,
// 101..120 parked.
inline std::vector<PointRecord> two_cycle_track() {
  return TrackBuilder().hold(9).move(31, 5.0).hold(30).move(30, 5.0).hold(20)
      .build();
}

// Kinematic points with only time and speed filled (classifier input).
inline std::vector<KinematicPoint>
speed_series(const std::vector<double> &speeds, double dt = 1.0) {
  std::vector<KinematicPoint> out(speeds.size());
  for (std::size_t i = 0; i < speeds.size(); ++i) {
    out[i].coord = {kBaseLat, kBaseLon, 0.0};
    out[i].time = kT0 + dt * static_cast<double>(i);
    out[i].time_rel = dt * static_cast<double>(i);
    out[i].time_delta_s = i ? dt : 0.0;
    out[i].speed = speeds[i];
    out[i].speed_smoothed = speeds[i];
  }
  return out;
}

inline bool near(double a, double b, double tol = 1e-6) {
  return std::fabs(a - b) <= tol;
}

inline void pass(const std::string &name) {
  std::cout << "  [PASS] " << name << std::endl;
}

} // namespace fixtures
