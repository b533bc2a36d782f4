#pragma once
#include "models/CycleModel.hpp"
#include <cstddef>
#include <string>

// Storage for analysed tracks. MySQLCycleDB is the production backend; tests
// use an in-memory one.
class CycleDB {
public:
  virtual ~CycleDB() = default;
  virtual void begin() = 0;
  virtual void commit() = 0;
  virtual void rollback() = 0;

  // Upsert the track row (idempotent by uid)
  virtual void upsert_track(const std::string &uid, std::size_t point_count,
                            double track_duration_s) = 0;

  // Remove cycle rows left by an earlier analysis of the same track
  virtual void delete_cycles(const std::string &uid) = 0;

  virtual void insert_cycle(const std::string &uid,
                            const CycleSummaryRow &row) = 0;
};

// Stores one report in a single transaction: track row, then its cycles
// replacing any previous ones. On failure rolls back and rethrows.
void persist_report(CycleDB &db, const CycleReport &report);
