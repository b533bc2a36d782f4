#include "core/PhaseClassifier.hpp"

#include <algorithm>

std::vector<MotionLabel>
PhaseClassifier::classify(const std::vector<KinematicPoint> &pts) const {
  const std::size_t n = pts.size();
  std::vector<MotionLabel> labels(n, MotionLabel::Stationary);
  if (n == 0)
    return labels;

  const double th_hi = P.speed_high;
  const double th_lo = P.speed_low;

  bool on = false;         // currently MOVING
  bool dwelling = false;   // below th_lo since dwell_start
  std::size_t dwell_start = 0;

  for (std::size_t i = 0; i < n; ++i) {
    const double v = pts[i].speed_smoothed;
    if (!on) {
      if (v > th_hi) {
        on = true;
        dwelling = false;
        labels[i] = MotionLabel::Moving;
      }
      continue;
    }

    labels[i] = MotionLabel::Moving;
    if (v >= th_lo) {
      dwelling = false; // a single fast sample cancels the dwell
      continue;
    }
    if (!dwelling) {
      dwelling = true;
      dwell_start = i;
    }
    if (pts[i].time - pts[dwell_start].time >= P.min_dwell_s) {
      std::fill(labels.begin() + dwell_start, labels.begin() + i + 1,
                MotionLabel::Stationary);
      on = false;
      dwelling = false;
    }
  }
  // a dwell still pending at end of stream stays MOVING
  return labels;
}

std::vector<LabelRun>
PhaseClassifier::label_runs(const std::vector<MotionLabel> &labels) {
  std::vector<LabelRun> runs;
  const std::size_t n = labels.size();
  for (std::size_t i = 0; i < n;) {
    std::size_t j = i + 1;
    while (j < n && labels[j] == labels[i])
      ++j;
    runs.push_back({i, j - 1, labels[i]});
    i = j;
  }
  return runs;
}
