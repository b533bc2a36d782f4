#pragma once
#include "models/CoreTypes.hpp"
#include "models/CycleModel.hpp"
#include "models/params.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

enum class SegmenterPhase : uint8_t { Idle, InCycle, Terminal };

// Complete state of the segmentation state machine. Passed explicitly so a
// slice of the stream can be replayed on its own.
struct SegmenterState {
  SegmenterPhase phase = SegmenterPhase::Idle;
  std::size_t cycle_start = 0;
  std::optional<std::size_t> idle_run_start; // open STATIONARY run in cycle
  double idle_run_length_s = 0.0;
  int pause_count = 0;
  double moving_time_s = 0.0;
};

class CycleSegmenter {
public:
  explicit CycleSegmenter(const CycleParams &p) : P(p) {}

  // Pass 1: greedy state machine over the labelled stream. Candidate ids are
  // provisional (1..n in order of detection).
  std::vector<Cycle>
  segment_candidates(const std::vector<KinematicPoint> &pts,
                     const std::vector<MotionLabel> &labels) const;

  // Pass 2: drop candidates below min_cycle_duration_s or
  // min_cycle_distance_m and renumber survivors from 1.
  std::vector<Cycle> filter_candidates(const std::vector<Cycle> &candidates) const;

  // Advance `state` by point `i`. Returns the cycle closed by this point.
  std::optional<Cycle> step(SegmenterState &state, std::size_t i,
                            const std::vector<KinematicPoint> &pts,
                            const std::vector<MotionLabel> &labels) const;

  // Close an open cycle at the last point of the stream.
  std::optional<Cycle> finish(SegmenterState &state,
                              const std::vector<KinematicPoint> &pts) const;

  static std::vector<AnnotatedPoint>
  annotate(const std::vector<KinematicPoint> &pts,
           const std::vector<MotionLabel> &labels,
           const std::vector<Cycle> &cycles);

private:
  CycleParams P;

  static Cycle make_cycle(const std::vector<KinematicPoint> &pts,
                          std::size_t a, std::size_t b,
                          const SegmenterState &state);
};
