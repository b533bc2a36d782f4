#include "core/TrackUtils.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>
#include <vector>

double TrackUtils::haversine(double lat1, double lon1, double lat2,
                             double lon2) {
  double phi1 = lat1 * (M_PI / 180);
  double phi2 = lat2 * (M_PI / 180);
  double delta_phi = (lat2 - lat1) * (M_PI / 180);
  double delta_gamma = (lon2 - lon1) * (M_PI / 180);
  double h = pow(sin(delta_phi / 2), 2) +
             cos(phi1) * cos(phi2) * pow(sin(delta_gamma / 2), 2);
  // rounding can push h a hair above 1 for antipodal points
  h = std::min(1.0, std::max(0.0, h));
  return 2 * kEarthRadiusM * asin(sqrt(h));
}
double TrackUtils::haversine(const Coordinate &p1, const Coordinate &p2) {
  return haversine(p1.lat, p1.lon, p2.lat, p2.lon);
}

double TrackUtils::initialBearingRad(const Coordinate &point_from,
                                     const Coordinate &point_to) {
  const double lat1 = point_from.lat * (M_PI / 180);
  const double lat2 = point_to.lat * (M_PI / 180);
  const double dlon = (point_to.lon - point_from.lon) * (M_PI / 180);
  const double y = std::sin(dlon) * std::cos(lat2);
  const double x = std::cos(lat1) * std::sin(lat2) -
                   std::sin(lat1) * std::cos(lat2) * std::cos(dlon);
  return std::atan2(y, x);
}

double TrackUtils::ang_diff(double a, double b) {
  const double d = b - a;
  return std::atan2(std::sin(d), std::cos(d)); // returns (−π, π]
}

bool TrackUtils::in_zone(const Coordinate &c, const Zone &z) {
  return haversine(c.lat, c.lon, z.lat, z.lon) <= z.radius_m;
}

double TrackUtils::median(std::vector<double> v) {
  if (v.empty())
    return 0.0;
  const size_t mid = v.size() / 2;
  std::nth_element(v.begin(), v.begin() + mid, v.end());
  double m = v[mid];
  if ((v.size() & 1) == 0) {
    // even → average two middles
    auto it = std::max_element(v.begin(), v.begin() + mid);
    m = 0.5 * (m + *it);
  }
  return m;
}

void TrackUtils::median_smooth_speed(std::vector<KinematicPoint> &pts,
                                     int med_win) {
  const int n = static_cast<int>(pts.size());
  if (med_win < 1)
    med_win = 1;
  if ((med_win & 1) == 0)
    med_win += 1;
  const int half = med_win / 2;
  if (half == 0) {
    for (auto &p : pts)
      p.speed_smoothed = p.speed;
    return;
  }

  std::vector<double> out(pts.size());
  std::vector<double> w;
  w.reserve(med_win);
  for (int i = 0; i < n; ++i) {
    const int a = std::max(0, i - half);
    const int b = std::min(n - 1, i + half);
    w.clear();
    for (int k = a; k <= b; ++k)
      w.push_back(pts[k].speed);
    out[i] = median(w);
  }
  for (int i = 0; i < n; ++i)
    pts[i].speed_smoothed = std::max(0.0, out[i]);
}

static std::string to_hex(const uint8_t *p, size_t n) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < n; ++i)
    oss << std::setw(2) << (int)p[i];
  return oss.str();
}

std::string
TrackUtils::track_fingerprint(const std::vector<KinematicPoint> &pts) {
  // "v1|lat,lon,time;lat,lon,time;..." with fixed decimals so the digest is
  // independent of locale and float printing defaults
  std::string material = "v1|";
  material.reserve(pts.size() * 40 + 3);
  char buf[96];
  for (size_t i = 0; i < pts.size(); ++i) {
    if (i)
      material.push_back(';');
    std::snprintf(buf, sizeof(buf), "%.6f,%.6f,%.3f", pts[i].coord.lat,
                  pts[i].coord.lon, pts[i].time);
    material += buf;
  }

  std::array<uint8_t, SHA256_DIGEST_LENGTH> uid{};
  SHA256(reinterpret_cast<const unsigned char *>(material.data()),
         material.size(), uid.data());
  return to_hex(uid.data(), uid.size());
}
