// CycleEngine chains the four stages over one track.

#include "core/CycleEngine.hpp"

#include "core/CycleSegmenter.hpp"
#include "core/CycleSummarizer.hpp"
#include "core/PhaseClassifier.hpp"
#include "core/PointNormalizer.hpp"
#include <iostream>

void CycleEngine::setParams(const CycleParams &params) {
  params.validate();
  P = params;
}

void CycleEngine::logSignal(const TrackSignal &signal) const {
  const NormalizeStats &st = signal.stats;
  if (st.dropped_non_monotonic > 0)
    std::cerr << "[warn] dropped " << st.dropped_non_monotonic
              << " point(s) with non-increasing timestamps\n";
  if (st.gap_count > 0)
    std::cerr << "[warn] " << st.gap_count << " time gap(s) above "
              << P.max_gap_s << " s (largest " << st.largest_gap_s << " s)\n";
  if (verbose_)
    std::cout << "[engine] kept " << st.kept_points << "/" << st.input_points
              << " points\n";
}

CycleAnalysis
CycleEngine::process(const std::vector<PointRecord> &records) const {
  P.validate();

  CycleAnalysis out;

  // 1) kinematics
  PointNormalizer normalizer;
  out.signal = normalizer.build(records, P);
  logSignal(out.signal);

  // 2) motion labels
  PhaseClassifier classifier(P);
  out.labels = classifier.classify(out.signal.points);
  if (verbose_) {
    auto runs = PhaseClassifier::label_runs(out.labels);
    std::size_t moving = 0;
    for (const auto &r : runs)
      if (r.label == MotionLabel::Moving)
        ++moving;
    std::cout << "[engine] " << runs.size() << " label run(s), " << moving
              << " moving\n";
  }

  // 3) greedy segmentation, then noise filter
  CycleSegmenter segmenter(P);
  out.candidates = segmenter.segment_candidates(out.signal.points, out.labels);
  out.cycles = segmenter.filter_candidates(out.candidates);
  if (verbose_)
    std::cout << "[engine] " << out.candidates.size() << " candidate(s), "
              << out.cycles.size() << " kept\n";

  // 4) tables
  CycleSummarizer summarizer(P);
  out.report = summarizer.summarize(
      out.signal, out.cycles,
      CycleSegmenter::annotate(out.signal.points, out.labels, out.cycles));
  return out;
}
