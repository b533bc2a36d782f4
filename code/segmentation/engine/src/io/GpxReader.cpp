#include "io/GpxReader.hpp"
#include "io/TimeFormat.hpp"
#include "models/TrackErrors.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <regex>
#include <sstream>

// strtod without exceptions; the whole (trimmed) token must be a number.
static std::optional<double> to_double(const std::string &s) {
  const char *b = s.c_str();
  while (*b == ' ' || *b == '\t' || *b == '\n' || *b == '\r')
    ++b;
  if (*b == '\0')
    return std::nullopt;
  char *end = nullptr;
  errno = 0;
  const double v = std::strtod(b, &end);
  if (errno == ERANGE || end == b)
    return std::nullopt;
  while (*end == ' ' || *end == '\t' || *end == '\n' || *end == '\r')
    ++end;
  if (*end != '\0')
    return std::nullopt;
  return v;
}

static std::string trim(const std::string &s) {
  const auto a = s.find_first_not_of(" \t\r\n");
  if (a == std::string::npos)
    return {};
  const auto b = s.find_last_not_of(" \t\r\n");
  return s.substr(a, b - a + 1);
}

GpxTrack GpxReader::read_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    throw MalformedTrackError("cannot open GPX file: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return parse(ss.str());
}

// Text between <tag> and </tag> inside an already bounded element body.
static std::optional<std::string> tag_text(const std::string &body,
                                           const std::string &tag) {
  const std::string open = "<" + tag + ">";
  const auto a = body.find(open);
  if (a == std::string::npos)
    return std::nullopt;
  const auto from = a + open.size();
  const auto b = body.find("</" + tag, from);
  if (b == std::string::npos)
    return std::nullopt;
  return body.substr(from, b - from);
}

GpxTrack GpxReader::parse(const std::string &xml) {
  // Element bounds come from find(); the regexes see one start tag at a
  // time and use bounded repetition.
  static const std::regex lat_re(
      R"(\blat\s{0,16}=\s{0,16}["']([^"']{0,64})["'])");
  static const std::regex lon_re(
      R"(\blon\s{0,16}=\s{0,16}["']([^"']{0,64})["'])");
  static const std::string kOpen = "<trkpt";

  GpxTrack out;
  bool any = false;
  std::size_t pos = 0;
  while ((pos = xml.find(kOpen, pos)) != std::string::npos) {
    const std::size_t name_end = pos + kOpen.size();
    if (name_end < xml.size()) {
      const char c = xml[name_end];
      if (!(c == '>' || c == '/' ||
            std::isspace(static_cast<unsigned char>(c)))) {
        pos = name_end; // <trkptExt> or similar
        continue;
      }
    }
    any = true;

    const std::size_t gt = xml.find('>', name_end);
    if (gt == std::string::npos) { // truncated start tag
      ++out.skipped;
      break;
    }
    std::string attrs = xml.substr(name_end, gt - name_end);
    std::string body;
    if (!attrs.empty() && attrs.back() == '/') {
      attrs.pop_back();
      pos = gt + 1;
    } else {
      const std::size_t close = xml.find("</trkpt", gt + 1);
      if (close == std::string::npos) { // never closed
        ++out.skipped;
        break;
      }
      body = xml.substr(gt + 1, close - gt - 1);
      const std::size_t end = xml.find('>', close);
      pos = end == std::string::npos ? xml.size() : end + 1;
    }

    std::smatch a;
    std::optional<double> lat, lon;
    if (std::regex_search(attrs, a, lat_re))
      lat = to_double(a[1].str());
    if (std::regex_search(attrs, a, lon_re))
      lon = to_double(a[1].str());

    std::optional<double> t;
    if (auto ts = tag_text(body, "time"))
      t = parse_iso8601(trim(*ts));

    if (!lat || !lon || !t) {
      ++out.skipped;
      continue;
    }

    PointRecord r;
    r.lat = *lat;
    r.lon = *lon;
    r.time = *t;
    if (auto ele = tag_text(body, "ele"))
      r.elevation = to_double(*ele);
    out.points.push_back(r);
  }

  if (!any)
    throw MalformedTrackError("no <trkpt> elements found in GPX input");
  if (out.skipped > 0)
    std::cerr << "[warn] skipped " << out.skipped
              << " track point(s) without usable time or position\n";
  return out;
}
