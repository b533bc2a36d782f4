// MySQLCycleDB wraps basic transactional operations for cycle storage.

#include "MySQLCycleDB.hpp"
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>

namespace {
struct StmtCloser {
  void operator()(MYSQL_STMT *s) const {
    if (s)
      mysql_stmt_close(s);
  }
};
using StmtPtr = std::unique_ptr<MYSQL_STMT, StmtCloser>;

StmtPtr prepare(MYSQL *conn, const char *sql) {
  StmtPtr stmt(mysql_stmt_init(conn));
  if (!stmt)
    throw std::runtime_error("mysql_stmt_init failed");
  if (mysql_stmt_prepare(stmt.get(), sql, strlen(sql)))
    throw std::runtime_error(mysql_stmt_error(stmt.get()));
  return stmt;
}

void bind_and_execute(MYSQL_STMT *stmt, MYSQL_BIND *b) {
  if (mysql_stmt_bind_param(stmt, b))
    throw std::runtime_error(mysql_stmt_error(stmt));
  if (mysql_stmt_execute(stmt))
    throw std::runtime_error(mysql_stmt_error(stmt));
}

void bind_string(MYSQL_BIND &b, const std::string &s, unsigned long &len) {
  len = s.size();
  b.buffer_type = MYSQL_TYPE_STRING;
  b.buffer = (void *)s.data();
  b.buffer_length = len;
  b.length = &len;
}

void bind_double(MYSQL_BIND &b, double &v) {
  b.buffer_type = MYSQL_TYPE_DOUBLE;
  b.buffer = &v;
}
} // namespace

// Establish connection using URI and credentials
MySQLCycleDB::MySQLCycleDB(const std::string &uri, const std::string &user,
                           const std::string &pass, const std::string &schema) {
  conn_ = mysql_init(nullptr);
  if (!conn_)
    throw std::runtime_error("mysql_init failed");
  // Parse URI "tcp://host:port"
  std::string host = uri, port = "3306";
  if (auto pos = uri.find("://"); pos != std::string::npos) {
    host = uri.substr(pos + 3);
  }
  if (auto p = host.find(':'); p != std::string::npos) {
    port = host.substr(p + 1);
    host = host.substr(0, p);
  }
  unsigned int port_num = 3306;
  try {
    port_num = static_cast<unsigned int>(std::stoi(port));
  } catch (const std::exception &) {
    mysql_close(conn_);
    throw std::runtime_error("bad port in db uri: " + uri);
  }
  if (!mysql_real_connect(conn_, host.c_str(), user.c_str(), pass.c_str(),
                          schema.c_str(), port_num, nullptr, 0)) {
    std::string err = mysql_error(conn_);
    mysql_close(conn_);
    throw std::runtime_error("connect failed: " + err);
  }
}

MySQLCycleDB::~MySQLCycleDB() { mysql_close(conn_); }

void MySQLCycleDB::begin() {
  if (mysql_query(conn_, "START TRANSACTION"))
    throw std::runtime_error(mysql_error(conn_));
}

void MySQLCycleDB::commit() {
  if (mysql_query(conn_, "COMMIT"))
    throw std::runtime_error(mysql_error(conn_));
}

void MySQLCycleDB::rollback() {
  if (mysql_query(conn_, "ROLLBACK"))
    throw std::runtime_error(mysql_error(conn_));
}

void MySQLCycleDB::ping() {
  if (mysql_ping(conn_))
    throw std::runtime_error(mysql_error(conn_));
}

void MySQLCycleDB::upsert_track(const std::string &uid,
                                std::size_t point_count,
                                double track_duration_s) {
  static const char *SQL = R"SQL(
      INSERT INTO tracks (track_uid, point_count, track_duration_s)
      VALUES (?, ?, ?)
      ON DUPLICATE KEY UPDATE
        point_count = VALUES(point_count),
        track_duration_s = VALUES(track_duration_s),
        analysed_at = CURRENT_TIMESTAMP
    )SQL";

  StmtPtr stmt = prepare(conn_, SQL);

  MYSQL_BIND b[3];
  memset(b, 0, sizeof(b));

  unsigned long uid_len = 0;
  bind_string(b[0], uid, uid_len);

  long long pc = static_cast<long long>(point_count);
  b[1].buffer_type = MYSQL_TYPE_LONGLONG;
  b[1].buffer = &pc;

  double dur = track_duration_s;
  bind_double(b[2], dur);

  bind_and_execute(stmt.get(), b);
}

void MySQLCycleDB::delete_cycles(const std::string &uid) {
  static const char *SQL = "DELETE FROM track_cycles WHERE track_uid = ?";
  StmtPtr stmt = prepare(conn_, SQL);

  MYSQL_BIND b[1];
  memset(b, 0, sizeof(b));
  unsigned long uid_len = 0;
  bind_string(b[0], uid, uid_len);

  bind_and_execute(stmt.get(), b);
}

void MySQLCycleDB::insert_cycle(const std::string &uid,
                                const CycleSummaryRow &row) {
  static const char *SQL = R"SQL(
      INSERT INTO track_cycles
        (track_uid, cycle_id, start_time, end_time, duration_s, distance_m,
         avg_speed_m_s, max_speed_m_s, pause_count, moving_time_s)
      VALUES (?, ?, FROM_UNIXTIME(?), FROM_UNIXTIME(?), ?, ?, ?, ?, ?, ?)
    )SQL";

  StmtPtr stmt = prepare(conn_, SQL);

  MYSQL_BIND b[10];
  memset(b, 0, sizeof(b));

  unsigned long uid_len = 0;
  bind_string(b[0], uid, uid_len);

  int cid = row.cycle_id;
  b[1].buffer_type = MYSQL_TYPE_LONG;
  b[1].buffer = &cid;

  double start = row.start_time, end = row.end_time;
  double dur = row.duration_s, dist = row.distance_m;
  double avg = row.avg_speed_m_s, vmax = row.max_speed_m_s;
  double moving = row.moving_time_s;
  bind_double(b[2], start);
  bind_double(b[3], end);
  bind_double(b[4], dur);
  bind_double(b[5], dist);
  bind_double(b[6], avg);
  bind_double(b[7], vmax);

  int pauses = row.pause_count;
  b[8].buffer_type = MYSQL_TYPE_LONG;
  b[8].buffer = &pauses;

  bind_double(b[9], moving);

  bind_and_execute(stmt.get(), b);
}
