#pragma once
#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <string>
#include <vector>

class TrackUtils {
public:
  // Mean Earth radius used by every distance in the engine.
  static constexpr double kEarthRadiusM = 6371000.0;

  // haversine formulas
  static double haversine(double lat1, double lon1, double lat2, double lon2);
  static double haversine(const Coordinate &p1, const Coordinate &p2);

  // Initial great-circle bearing from -> to, radians in (-pi, pi]
  static double initialBearingRad(const Coordinate &point_from,
                                  const Coordinate &point_to);
  static double ang_diff(double a, double b);

  static bool in_zone(const Coordinate &c, const Zone &z);

  static double median(std::vector<double> v);

  // Centred running median of `speed` into `speed_smoothed` (odd window).
  static void median_smooth_speed(std::vector<KinematicPoint> &pts,
                                  int med_win);

  // SHA-256 of "v1|lat,lon,time;..." over the normalised points.
  static std::string track_fingerprint(const std::vector<KinematicPoint> &pts);
};
