#include "io/TimeFormat.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <ctime>

std::optional<double> parse_iso8601(const std::string &s) {
  int Y, M, D, h, m, sec;
  char sep;
  int consumed = 0;
  if (std::sscanf(s.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n", &Y, &M, &D, &sep,
                  &h, &m, &sec, &consumed) != 7)
    return std::nullopt;
  if (sep != 'T' && sep != 't' && sep != ' ')
    return std::nullopt;
  if (M < 1 || M > 12 || D < 1 || D > 31 || h > 23 || m > 59 || sec > 60 ||
      h < 0 || m < 0 || sec < 0)
    return std::nullopt;

  std::size_t pos = static_cast<std::size_t>(consumed);
  double frac = 0.0;
  if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
    ++pos;
    double scale = 0.1;
    std::size_t digits = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
      frac += (s[pos] - '0') * scale;
      scale /= 10.0;
      ++pos;
      ++digits;
    }
    if (digits == 0)
      return std::nullopt;
  }

  int offset_s = 0;
  if (pos < s.size()) {
    const char z = s[pos];
    if (z == 'Z' || z == 'z') {
      ++pos;
    } else if (z == '+' || z == '-') {
      int oh = 0, om = 0, n = 0;
      const char *rest = s.c_str() + pos + 1;
      if (std::sscanf(rest, "%2d:%2d%n", &oh, &om, &n) == 2 ||
          std::sscanf(rest, "%2d%2d%n", &oh, &om, &n) == 2) {
        pos += 1 + static_cast<std::size_t>(n);
      } else if (std::sscanf(rest, "%2d%n", &oh, &n) == 1) {
        pos += 1 + static_cast<std::size_t>(n);
      } else {
        return std::nullopt;
      }
      if (oh > 23 || om > 59)
        return std::nullopt;
      offset_s = (oh * 3600 + om * 60) * (z == '-' ? -1 : 1);
    } else {
      return std::nullopt;
    }
  }
  if (pos != s.size())
    return std::nullopt;

  std::tm tm{};
  tm.tm_year = Y - 1900;
  tm.tm_mon = M - 1;
  tm.tm_mday = D;
  tm.tm_hour = h;
  tm.tm_min = m;
  tm.tm_sec = sec;
  const std::time_t t = timegm(&tm);
  return static_cast<double>(t) - offset_s + frac;
}

std::string format_iso8601(double epoch_s) {
  double whole = std::floor(epoch_s);
  long long ms = std::llround((epoch_s - whole) * 1000.0);
  if (ms >= 1000) {
    whole += 1.0;
    ms -= 1000;
  }
  const std::time_t t = static_cast<std::time_t>(whole);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[40];
  if (ms == 0)
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                  tm.tm_min, tm.tm_sec);
  else
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03lldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                  tm.tm_min, tm.tm_sec, ms);
  return buf;
}
