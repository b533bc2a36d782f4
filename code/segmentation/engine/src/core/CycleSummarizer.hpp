#pragma once
#include "models/CoreTypes.hpp"
#include "models/CycleModel.hpp"
#include "models/params.hpp"
#include <vector>

class CycleSummarizer {
public:
  explicit CycleSummarizer(const CycleParams &p) : P(p) {}

  // Builds the summary and annotated tables. Performs no I/O. Throws
  // EmptyCycleSetError only when params.require_cycles is set and `cycles`
  // is empty.
  CycleReport summarize(const TrackSignal &signal,
                        const std::vector<Cycle> &cycles,
                        std::vector<AnnotatedPoint> annotated) const;

  CycleSummaryRow summarize_cycle(const std::vector<KinematicPoint> &pts,
                                  const Cycle &c) const;

  static TrackAggregates aggregate(const TrackSignal &signal,
                                   const std::vector<CycleSummaryRow> &rows);

private:
  CycleParams P;

  CyclePhases split_phases(const std::vector<KinematicPoint> &pts,
                           const Cycle &c, const Zone &dump) const;
};
