#include "core/CycleDB.hpp"
#include "core/CycleEngine.hpp"
#include "io/FileStore.hpp"
#include "track_fixtures.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fixtures;
namespace fs = std::filesystem;

// Transactional in-memory store: writes go to a staged copy that replaces the
// committed one on commit().
class MemoryCycleDB : public CycleDB {
public:
  struct TrackRow {
    std::size_t point_count = 0;
    double track_duration_s = 0.0;
  };
  struct State {
    std::map<std::string, TrackRow> tracks;
    std::map<std::string, std::vector<CycleSummaryRow>> cycles;
  };

  void begin() override {
    if (in_tx_)
      throw std::runtime_error("nested transaction");
    staged_ = committed_;
    in_tx_ = true;
  }
  void commit() override {
    require_tx();
    committed_ = staged_;
    in_tx_ = false;
  }
  void rollback() override {
    require_tx();
    ++rollbacks;
    in_tx_ = false;
  }
  void upsert_track(const std::string &uid, std::size_t point_count,
                    double track_duration_s) override {
    require_tx();
    staged_.tracks[uid] = TrackRow{point_count, track_duration_s};
  }
  void delete_cycles(const std::string &uid) override {
    require_tx();
    staged_.cycles.erase(uid);
  }
  void insert_cycle(const std::string &uid,
                    const CycleSummaryRow &row) override {
    require_tx();
    if (fail_on_cycle == row.cycle_id)
      throw std::runtime_error("insert failed");
    staged_.cycles[uid].push_back(row);
  }

  const State &committed() const { return committed_; }
  bool in_transaction() const { return in_tx_; }

  int fail_on_cycle = 0;
  int rollbacks = 0;

private:
  void require_tx() const {
    if (!in_tx_)
      throw std::logic_error("no open transaction");
  }

  State committed_;
  State staged_;
  bool in_tx_ = false;
};

static CycleReport scenario_report() {
  CycleParams p;
  p.min_idle_duration_s = 5.0;
  p.min_cycle_duration_s = 10.0;
  p.min_cycle_distance_m = 10.0;
  return CycleEngine(p).process(two_cycle_track()).report;
}

static void check_persist() {
  MemoryCycleDB db;
  CycleReport r = scenario_report();
  persist_report(db, r);
  const std::string &uid = r.aggregates.track_uid;
  assert(!db.in_transaction());
  assert(db.committed().tracks.size() == 1);
  assert(db.committed().tracks.at(uid).point_count == 121);
  assert(near(db.committed().tracks.at(uid).track_duration_s, 120.0));
  const auto &rows = db.committed().cycles.at(uid);
  assert(rows.size() == 2);
  assert(rows[0].cycle_id == 1 && rows[1].cycle_id == 2);

  // re-analysing the same track replaces its cycles
  persist_report(db, r);
  assert(db.committed().tracks.size() == 1);
  assert(db.committed().cycles.at(uid).size() == 2);
  pass("track row and cycles stored, idempotent by uid");
}

static void check_zero_cycles_clears() {
  MemoryCycleDB db;
  CycleReport r = scenario_report();
  persist_report(db, r);
  CycleReport none = r;
  none.rows.clear();
  persist_report(db, none);
  assert(db.committed().cycles.count(r.aggregates.track_uid) == 0);
  assert(db.committed().tracks.size() == 1);
  pass("a report without cycles removes stale cycle rows");
}

static void check_rollback() {
  MemoryCycleDB db;
  CycleReport r = scenario_report();
  persist_report(db, r);

  db.fail_on_cycle = 2;
  bool threw = false;
  try {
    persist_report(db, r);
  } catch (const std::runtime_error &) {
    threw = true;
  }
  assert(threw);
  assert(db.rollbacks == 1);
  assert(!db.in_transaction());
  // committed state from the first run is untouched
  assert(db.committed().cycles.at(r.aggregates.track_uid).size() == 2);

  MemoryCycleDB fresh;
  fresh.fail_on_cycle = 1;
  threw = false;
  try {
    persist_report(fresh, r);
  } catch (const std::runtime_error &) {
    threw = true;
  }
  assert(threw);
  assert(fresh.committed().tracks.empty());
  pass("failed insert rolls back and rethrows");
}

static void check_missing_uid() {
  MemoryCycleDB db;
  CycleReport r = scenario_report();
  r.aggregates.track_uid.clear();
  bool threw = false;
  try {
    persist_report(db, r);
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);
  assert(!db.in_transaction());
  pass("report without track uid rejected");
}

static void check_file_store() {
  fs::path dir = fs::temp_directory_path() / "haulcycle_verify_store";
  fs::remove_all(dir);
  fs::create_directories(dir);

  const std::string ok = (dir / "track_a.gpx").string();
  store_file(ok, "<gpx/>");
  std::ifstream in(ok, std::ios::binary);
  std::ostringstream body;
  body << in.rdbuf();
  assert(body.str() == "<gpx/>");
  assert(!fs::exists(ok + ".part"));

  // target occupied by a directory: the save fails and leaves nothing behind
  const fs::path blocked = dir / "track_b.gpx";
  fs::create_directories(blocked / "inner");
  bool threw = false;
  try {
    store_file(blocked.string(), "<gpx/>");
  } catch (const std::runtime_error &) {
    threw = true;
  }
  assert(threw);
  assert(!fs::exists(blocked.string() + ".part"));
  assert(fs::is_directory(blocked / "inner"));

  // missing parent directory
  threw = false;
  const fs::path orphan = dir / "missing" / "track_c.gpx";
  try {
    store_file(orphan.string(), "<gpx/>");
  } catch (const std::runtime_error &) {
    threw = true;
  }
  assert(threw);
  assert(!fs::exists(orphan.parent_path()));

  std::size_t files = 0;
  for (const auto &de : fs::directory_iterator(dir))
    files += de.is_regular_file() ? 1 : 0;
  assert(files == 1);
  fs::remove_all(dir);
  pass("failed upload save leaves no partial file");
}

int main() {
  std::cout << "Starting Persistence Verification..." << std::endl;
  check_persist();
  check_zero_cycles_clears();
  check_rollback();
  check_missing_uid();
  check_file_store();
  std::cout << "Persistence OK" << std::endl;
  return 0;
}
