#include "core/CycleDB.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>

void persist_report(CycleDB &db, const CycleReport &report) {
  const TrackAggregates &agg = report.aggregates;
  if (agg.track_uid.empty())
    throw std::invalid_argument("persist_report: report has no track_uid");

  db.begin();
  try {
    db.upsert_track(agg.track_uid, agg.point_count, agg.track_duration_s);
    db.delete_cycles(agg.track_uid);
    for (const auto &row : report.rows)
      db.insert_cycle(agg.track_uid, row);
    db.commit();
  } catch (const std::exception &e) {
    std::cerr << "[DB ERROR] persist " << agg.track_uid << ": " << e.what()
              << " (rolling back)\n";
    try {
      db.rollback();
    } catch (const std::exception &re) {
      std::cerr << "[DB ERROR] rollback failed: " << re.what() << "\n";
    }
    throw;
  }
}
