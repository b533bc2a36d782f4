#pragma once
#include "core/CycleDB.hpp"
#include <mysql/mysql.h>
#include <string>

class MySQLCycleDB final : public CycleDB {
public:
  // uri is "tcp://host:port" or "host[:port]"
  MySQLCycleDB(const std::string &uri, const std::string &user,
               const std::string &pass, const std::string &schema);
  ~MySQLCycleDB();

  MySQLCycleDB(const MySQLCycleDB &) = delete;
  MySQLCycleDB &operator=(const MySQLCycleDB &) = delete;

  void begin() override;
  void commit() override;
  void rollback() override;
  void upsert_track(const std::string &uid, std::size_t point_count,
                    double track_duration_s) override;
  void delete_cycles(const std::string &uid) override;
  void insert_cycle(const std::string &uid,
                    const CycleSummaryRow &row) override;

  // Round-trip to the server; throws on failure.
  void ping();

private:
  MYSQL *conn_ = nullptr;
};
