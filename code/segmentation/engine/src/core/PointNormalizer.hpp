#pragma once
#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <vector>

// Turns decoded fixes into a time-ordered kinematic sequence.
class PointNormalizer {
public:
  PointNormalizer() = default;

  // Throws MalformedTrackError when fewer than 2 usable points remain or a
  // fix carries an impossible coordinate.
  TrackSignal build(const std::vector<PointRecord> &records,
                    const CycleParams &params) const;

private:
  void computeKinematics(TrackSignal &signal, const CycleParams &params) const;
};
