#include "core/PhaseClassifier.hpp"
#include "track_fixtures.hpp"
#include <cassert>
#include <iostream>
#include <vector>

using namespace fixtures;
using ML = MotionLabel;

static CycleParams params() {
  CycleParams p;
  p.speed_high = 1.0;
  p.speed_low = 0.3;
  p.min_dwell_s = 3.0;
  return p;
}

static void check_all_slow() {
  PhaseClassifier c(params());
  auto labels = c.classify(speed_series({0.0, 0.5, 0.9, 1.0, 0.2, 0.99, 0.0}));
  for (auto l : labels)
    assert(l == ML::Stationary);
  assert(c.classify({}).empty());
  pass("nothing above speed_high: all stationary");
}

static void check_enter_and_band() {
  PhaseClassifier c(params());
  // strictly above speed_high enters; the band (low, high] keeps MOVING
  auto labels = c.classify(speed_series({0.0, 1.0, 1.01, 0.5, 0.31, 0.9, 2.0}));
  assert(labels[0] == ML::Stationary);
  assert(labels[1] == ML::Stationary);
  for (std::size_t i = 2; i < labels.size(); ++i)
    assert(labels[i] == ML::Moving);
  pass("hysteresis band holds MOVING");
}

static void check_dwell_relabels() {
  PhaseClassifier c(params());
  //                         0    1    2    3    4    5    6    7    8
  auto labels = c.classify(speed_series({2.0, 2.0, 0.1, 0.1, 0.1, 0.1, 0.0,
                                         0.5, 0.0}));
  assert(labels[0] == ML::Moving && labels[1] == ML::Moving);
  // dwell starts at 2, completes at 5 (3 s); 2..5 become stationary
  for (std::size_t i = 2; i <= 5; ++i)
    assert(labels[i] == ML::Stationary);
  // 0.5 is below speed_high, so no re-entry
  assert(labels[6] == ML::Stationary);
  assert(labels[7] == ML::Stationary);
  assert(labels[8] == ML::Stationary);
  pass("completed dwell is relabelled stationary");
}

static void check_short_dip_cancelled() {
  PhaseClassifier c(params());
  auto labels = c.classify(
      speed_series({2.0, 0.1, 0.1, 0.4, 0.1, 0.1, 2.0, 2.0}));
  // two 2-sample dips (1 s each) separated by 0.4 >= speed_low
  for (std::size_t i = 1; i < labels.size(); ++i)
    assert(labels[i] == ML::Moving);
  pass("a fast sample cancels an incomplete dwell");
}

static void check_pending_dwell_at_end() {
  PhaseClassifier c(params());
  auto labels = c.classify(speed_series({0.0, 3.0, 3.0, 0.0, 0.0}));
  assert(labels[3] == ML::Moving && labels[4] == ML::Moving);
  pass("dwell still pending at end of stream stays MOVING");
}

static void check_irregular_sampling() {
  PhaseClassifier c(params());
  // 0.5 s sampling: dwell needs 6 samples past the start
  auto labels = c.classify(
      speed_series({2, 2, 0, 0, 0, 0, 0, 0, 0}, 0.5));
  assert(labels[2] == ML::Stationary);
  assert(labels[8] == ML::Stationary);
  auto partial = c.classify(speed_series({2, 2, 0, 0, 0, 0, 0}, 0.5));
  assert(partial[6] == ML::Moving); // 2.0 s < min_dwell
  pass("dwell measured in time, not samples");
}

static void check_label_runs() {
  std::vector<ML> labels = {ML::Stationary, ML::Stationary, ML::Moving,
                            ML::Moving,     ML::Moving,     ML::Stationary};
  auto runs = PhaseClassifier::label_runs(labels);
  assert(runs.size() == 3);
  assert(runs[0].first == 0 && runs[0].last == 1 &&
         runs[0].label == ML::Stationary);
  assert(runs[1].first == 2 && runs[1].last == 4 &&
         runs[1].label == ML::Moving);
  assert(runs[2].first == 5 && runs[2].last == 5);
  assert(PhaseClassifier::label_runs({}).empty());
  pass("label_runs");
}

int main() {
  std::cout << "Starting PhaseClassifier Verification..." << std::endl;
  check_all_slow();
  check_enter_and_band();
  check_dwell_relabels();
  check_short_dip_cancelled();
  check_pending_dwell_at_end();
  check_irregular_sampling();
  check_label_runs();
  std::cout << "PhaseClassifier OK" << std::endl;
  return 0;
}
