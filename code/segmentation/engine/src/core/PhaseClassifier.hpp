#pragma once
#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <cstddef>
#include <vector>

// Maximal run of identical labels, inclusive bounds.
struct LabelRun {
  std::size_t first;
  std::size_t last;
  MotionLabel label;
};

class PhaseClassifier {
public:
  explicit PhaseClassifier(const CycleParams &p) : P(p) {}

  // One label per point. Starts STATIONARY; enters MOVING above speed_high,
  // leaves it only after speed stays below speed_low for min_dwell_s, and
  // the whole dwell is then relabelled STATIONARY.
  std::vector<MotionLabel>
  classify(const std::vector<KinematicPoint> &pts) const;

  static std::vector<LabelRun> label_runs(const std::vector<MotionLabel> &labels);

private:
  CycleParams P;
};
