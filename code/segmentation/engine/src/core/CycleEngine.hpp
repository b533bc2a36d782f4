#pragma once
#include "models/CoreTypes.hpp"
#include "models/CycleModel.hpp"
#include "models/params.hpp"
#include <utility>
#include <vector>
// Main entry point of the cycle engine
//
// raw fixes -> PointNormalizer -> PhaseClassifier -> CycleSegmenter
//           -> CycleSummarizer
//------------------------------------------------------------------------------

// Every intermediate product of one run, kept for charts and debugging.
struct CycleAnalysis {
  TrackSignal signal;
  std::vector<MotionLabel> labels;
  std::vector<Cycle> candidates; // before the duration/distance filter
  std::vector<Cycle> cycles;     // finalised, ids from 1
  CycleReport report;
};

class CycleEngine {
public:
  explicit CycleEngine(CycleParams p = CycleParams{}, bool verbose = false)
      : P(std::move(p)), verbose_(verbose) {}
  ~CycleEngine() = default;

  // Validates before storing. Throws ConfigurationError.
  void setParams(const CycleParams &params);
  const CycleParams &params() const noexcept { return P; }

  // Runs the full pipeline. Throws ConfigurationError, MalformedTrackError,
  // or EmptyCycleSetError (only with require_cycles).
  CycleAnalysis process(const std::vector<PointRecord> &records) const;

private:
  CycleParams P;
  bool verbose_ = false;

  void logSignal(const TrackSignal &signal) const;
};
