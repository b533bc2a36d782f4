#pragma once
#include "models/CycleModel.hpp"
#include <ostream>
#include <string>
#include <vector>

// Fixed-column, fixed-precision CSV tables. Identical input gives identical
// bytes. Missing values are written as empty fields.
class CsvWriter {
public:
  static void write_summary(std::ostream &os,
                            const std::vector<CycleSummaryRow> &rows);
  static void write_points(std::ostream &os,
                           const std::vector<AnnotatedPoint> &points);

  // Writes <prefix>cycle_summary.csv and <prefix>points_with_cycles.csv.
  // Returns the paths written. Throws std::runtime_error if a file cannot be
  // created.
  static std::vector<std::string> write_report(const CycleReport &report,
                                               const std::string &prefix);

  static std::string summary_path(const std::string &prefix) {
    return prefix + "cycle_summary.csv";
  }
  static std::string points_path(const std::string &prefix) {
    return prefix + "points_with_cycles.csv";
  }
};
