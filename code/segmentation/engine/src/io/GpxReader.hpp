#pragma once
#include "models/CoreTypes.hpp"
#include <cstddef>
#include <string>
#include <vector>

struct GpxTrack {
  std::vector<PointRecord> points; // document order
  std::size_t skipped = 0;         // <trkpt> without usable time/lat/lon
};

// <trkpt> decoder: elements are located with plain string search and their
// lat/lon attributes read with small regexes. Enough for GPX 1.0/1.1 files
// written by loggers and phones; not a general XML parser. A truncated or
// unclosed trailing <trkpt> counts as skipped.
class GpxReader {
public:
  // Throws MalformedTrackError when the file cannot be read.
  static GpxTrack read_file(const std::string &path);

  // Throws MalformedTrackError when the text has no <trkpt> element.
  static GpxTrack parse(const std::string &xml);
};
