// ============================================================================
// sqlite_store.cpp — implementation for sqlite_store.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "sqlite_store.hpp"
#include "meshview/log.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cmath>
#include <limits>
#include <type_traits>
#include <unordered_map>

namespace meshview {

using nlohmann::json;

namespace {

// ---------- statement / transaction helpers ----------

StoreStatus status_of(int rc) {
  switch (rc & 0xff) {                           // primary code; extended codes keep it in the low byte
    case SQLITE_OK:
    case SQLITE_ROW:
    case SQLITE_DONE:   return StoreStatus::Ok;
    case SQLITE_BUSY:
    case SQLITE_LOCKED: return StoreStatus::Busy;
    default:            return StoreStatus::Failed;
  }
}

class Stmt {
public:
  Stmt(sqlite3* db, const char* sql) : db_(db) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
    if (rc_ != SQLITE_OK) {
      LogLine(LogLevel::Error, "sqlite_prepare_failed").kv("reason", sqlite3_errmsg(db));
    }
  }
  ~Stmt() { sqlite3_finalize(st_); }

  Stmt(const Stmt&) = delete;
  Stmt& operator=(const Stmt&) = delete;

  bool ok() const { return rc_ == SQLITE_OK; }
  int  rc() const { return rc_; }

  void i64(int idx, int64_t v) { sqlite3_bind_int64(st_, idx, v); }
  void dbl(int idx, double v) { sqlite3_bind_double(st_, idx, v); }
  void null(int idx) { sqlite3_bind_null(st_, idx); }
  void text(int idx, const std::string& v) {
    sqlite3_bind_text(st_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
  }
  void blob(int idx, const std::vector<uint8_t>& v) {
    sqlite3_bind_blob(st_, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
  }
  template <typename T>
  void opt_i64(int idx, const std::optional<T>& v) { if (v) i64(idx, static_cast<int64_t>(*v)); else null(idx); }
  template <typename T>
  void opt_dbl(int idx, const std::optional<T>& v) { if (v) dbl(idx, static_cast<double>(*v)); else null(idx); }

  int step() {
    rc_ = sqlite3_step(st_);
    if (rc_ != SQLITE_ROW && rc_ != SQLITE_DONE && status_of(rc_) == StoreStatus::Failed) {
      LogLine(LogLevel::Warn, "sqlite_step_failed").kv("rc", rc_).kv("reason", sqlite3_errmsg(db_));
    }
    return rc_;
  }

  bool is_null(int col) const { return sqlite3_column_type(st_, col) == SQLITE_NULL; }
  int64_t col_i64(int col) const { return sqlite3_column_int64(st_, col); }
  double  col_dbl(int col) const { return sqlite3_column_double(st_, col); }
  std::string col_text(int col) const {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st_, col)))
             : std::string();
  }
  std::vector<uint8_t> col_blob(int col) const {
    const auto* b = static_cast<const uint8_t*>(sqlite3_column_blob(st_, col));
    const int n = sqlite3_column_bytes(st_, col);
    return b ? std::vector<uint8_t>(b, b + n) : std::vector<uint8_t>();
  }
  template <typename T>
  std::optional<T> col_opt(int col) const {
    if (is_null(col)) return std::nullopt;
    if constexpr (std::is_floating_point_v<T>) return static_cast<T>(col_dbl(col));
    else return static_cast<T>(col_i64(col));
  }

private:
  sqlite3* db_;
  sqlite3_stmt* st_{nullptr};
  int rc_{SQLITE_OK};
};

// Txn — BEGIN IMMEDIATE on construction, ROLLBACK unless commit() succeeded.
class Txn {
public:
  explicit Txn(sqlite3* db) : db_(db) {
    rc_ = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
  }
  ~Txn() {
    if (open_()) sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
  }
  StoreStatus begun() const { return status_of(rc_); }
  StoreStatus commit() {
    rc_ = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr);
    if (rc_ == SQLITE_OK) committed_ = true;
    return status_of(rc_);
  }

private:
  bool open_() const { return !committed_ && sqlite3_get_autocommit(db_) == 0; }

  sqlite3* db_;
  int rc_{SQLITE_OK};
  bool committed_{false};
};

// ---------- JSON encoding of route arrays ----------

std::string route_json(const std::vector<NodeNum>& r) {
  return json(r).dump();
}

std::string snr_json(const std::vector<float>& s) {
  json j = json::array();
  for (float v : s) {
    if (std::isnan(v)) j.push_back(nullptr);    // unknown hop
    else j.push_back(v);
  }
  return j.dump();
}

std::vector<NodeNum> route_from_json(const std::string& text) {
  std::vector<NodeNum> out;
  const json j = json::parse(text, nullptr, /*allow_exceptions*/false);
  if (!j.is_array()) return out;
  for (const auto& v : j) {
    if (v.is_number_unsigned()) out.push_back(v.get<NodeNum>());
  }
  return out;
}

std::vector<float> snr_from_json(const std::string& text) {
  std::vector<float> out;
  const json j = json::parse(text, nullptr, /*allow_exceptions*/false);
  if (!j.is_array()) return out;
  for (const auto& v : j) {
    out.push_back(v.is_number() ? v.get<float>() : std::numeric_limits<float>::quiet_NaN());
  }
  return out;
}

// ---------- row readers ----------

const char* NODE_SELECT =
  "SELECT node_id, long_name, long_name_at, short_name, short_name_at, hw_model, hw_model_at,"
  " role, role_at, firmware, firmware_at, channel, channel_at, lat, lon, alt, position_at,"
  " battery_level, voltage, channel_utilization, air_util_tx, uptime_seconds, device_at,"
  " temperature, relative_humidity, barometric_pressure, gas_resistance, iaq, wind_direction,"
  " wind_speed, environment_at, last_seen FROM node";

template <typename T, typename Conv>
void read_stamped(const Stmt& s, int val_col, int at_col, Stamped<T>& out, Conv conv) {
  if (s.is_null(at_col)) return;                // never written
  out.value = conv(val_col);
  out.updated_at = s.col_i64(at_col);
}

Node read_node(const Stmt& s) {
  Node n;
  n.node_id = static_cast<NodeNum>(s.col_i64(0));
  read_stamped(s, 1, 2, n.long_name,  [&](int c) { return LongNameStr(s.col_text(c).c_str()); });
  read_stamped(s, 3, 4, n.short_name, [&](int c) { return ShortNameStr(s.col_text(c).c_str()); });
  read_stamped(s, 5, 6, n.hw_model,   [&](int c) { return static_cast<uint32_t>(s.col_i64(c)); });
  read_stamped(s, 7, 8, n.role,       [&](int c) { return static_cast<uint32_t>(s.col_i64(c)); });
  read_stamped(s, 9, 10, n.firmware,  [&](int c) { return FirmwareStr(s.col_text(c).c_str()); });
  read_stamped(s, 11, 12, n.channel,  [&](int c) { return ChannelStr(s.col_text(c).c_str()); });
  read_stamped(s, 13, 16, n.position, [&](int c) {
    Position p;
    p.lat = s.col_dbl(c);
    p.lon = s.col_dbl(c + 1);
    p.altitude = s.col_opt<int32_t>(c + 2);
    return p;
  });
  read_stamped(s, 17, 22, n.device_metrics, [&](int c) {
    DeviceMetrics d;
    d.battery_level       = s.col_opt<uint32_t>(c);
    d.voltage             = s.col_opt<float>(c + 1);
    d.channel_utilization = s.col_opt<float>(c + 2);
    d.air_util_tx         = s.col_opt<float>(c + 3);
    d.uptime_seconds      = s.col_opt<uint32_t>(c + 4);
    return d;
  });
  read_stamped(s, 23, 30, n.environment_metrics, [&](int c) {
    EnvironmentMetrics e;
    e.temperature         = s.col_opt<float>(c);
    e.relative_humidity   = s.col_opt<float>(c + 1);
    e.barometric_pressure = s.col_opt<float>(c + 2);
    e.gas_resistance      = s.col_opt<float>(c + 3);
    e.iaq                 = s.col_opt<uint32_t>(c + 4);
    e.wind_direction      = s.col_opt<uint32_t>(c + 5);
    e.wind_speed          = s.col_opt<float>(c + 6);
    return e;
  });
  n.last_seen = s.col_i64(31);
  return n;
}

const char* PACKET_SELECT =
  "SELECT id, from_node_id, to_node_id, channel, portnum, payload, encrypted, want_response,"
  " request_id, import_time FROM packet";

Packet read_packet(const Stmt& s) {
  Packet p;
  p.key.packet_id   = static_cast<PacketId>(s.col_i64(0));
  p.key.from        = static_cast<NodeNum>(s.col_i64(1));
  p.to              = static_cast<NodeNum>(s.col_i64(2));
  p.channel         = ChannelStr(s.col_text(3).c_str());
  p.portnum         = s.col_opt<uint32_t>(4);
  p.payload         = s.col_blob(5);
  p.encrypted       = s.col_i64(6) != 0;
  p.want_response   = s.col_i64(7) != 0;
  p.request_id      = static_cast<PacketId>(s.col_i64(8));
  p.import_time     = s.col_i64(9);
  return p;
}

const char* TRACE_SELECT =
  "SELECT packet_id, from_node_id, target, gateway, route, snr_towards, route_back, snr_back,"
  " done, import_time, updated_at FROM traceroute";

Traceroute read_trace(const Stmt& s) {
  Traceroute t;
  t.key.packet_id = static_cast<PacketId>(s.col_i64(0));
  t.key.from      = static_cast<NodeNum>(s.col_i64(1));
  t.target        = static_cast<NodeNum>(s.col_i64(2));
  t.gateway       = static_cast<NodeNum>(s.col_i64(3));
  t.route         = route_from_json(s.col_text(4));
  t.snr_towards   = snr_from_json(s.col_text(5));
  t.route_back    = route_from_json(s.col_text(6));
  t.snr_back      = snr_from_json(s.col_text(7));
  t.done          = s.col_i64(8) != 0;
  t.import_time   = s.col_i64(9);
  t.updated_at    = s.col_i64(10);
  return t;
}

// ---------- schema ----------

const char* SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS node (
  node_id INTEGER PRIMARY KEY,
  long_name TEXT, long_name_at INTEGER,
  short_name TEXT, short_name_at INTEGER,
  hw_model INTEGER, hw_model_at INTEGER,
  role INTEGER, role_at INTEGER,
  firmware TEXT, firmware_at INTEGER,
  channel TEXT, channel_at INTEGER,
  lat REAL, lon REAL, alt INTEGER, position_at INTEGER,
  battery_level INTEGER, voltage REAL, channel_utilization REAL, air_util_tx REAL,
  uptime_seconds INTEGER, device_at INTEGER,
  temperature REAL, relative_humidity REAL, barometric_pressure REAL, gas_resistance REAL,
  iaq INTEGER, wind_direction INTEGER, wind_speed REAL, environment_at INTEGER,
  last_seen INTEGER NOT NULL DEFAULT 0
);
CREATE TABLE IF NOT EXISTS packet (
  id INTEGER NOT NULL,
  from_node_id INTEGER NOT NULL,
  to_node_id INTEGER NOT NULL,
  channel TEXT,
  portnum INTEGER,
  payload BLOB,
  encrypted INTEGER NOT NULL DEFAULT 0,
  want_response INTEGER NOT NULL DEFAULT 0,
  request_id INTEGER NOT NULL DEFAULT 0,
  import_time INTEGER NOT NULL,
  PRIMARY KEY (id, from_node_id)
);
CREATE TABLE IF NOT EXISTS packet_seen (
  packet_id INTEGER NOT NULL,
  from_node_id INTEGER NOT NULL,
  node_id INTEGER NOT NULL,
  channel TEXT,
  topic TEXT,
  rx_snr REAL,
  rx_rssi INTEGER,
  hop_limit INTEGER,
  hop_start INTEGER,
  hop_count INTEGER,
  rx_time INTEGER,
  import_time INTEGER NOT NULL,
  PRIMARY KEY (packet_id, from_node_id, node_id)
);
CREATE TABLE IF NOT EXISTS traceroute (
  packet_id INTEGER NOT NULL,
  from_node_id INTEGER NOT NULL,
  target INTEGER,
  gateway INTEGER,
  route TEXT NOT NULL DEFAULT '[]',
  snr_towards TEXT NOT NULL DEFAULT '[]',
  route_back TEXT NOT NULL DEFAULT '[]',
  snr_back TEXT NOT NULL DEFAULT '[]',
  done INTEGER NOT NULL DEFAULT 0,
  import_time INTEGER NOT NULL,
  updated_at INTEGER NOT NULL,
  PRIMARY KEY (packet_id, from_node_id)
);
CREATE INDEX IF NOT EXISTS idx_packet_from_node_id_import_time ON packet (from_node_id, import_time DESC);
CREATE INDEX IF NOT EXISTS idx_packet_import_time ON packet (import_time);
CREATE INDEX IF NOT EXISTS idx_packet_seen_packet_id ON packet_seen (packet_id);
CREATE INDEX IF NOT EXISTS idx_traceroute_packet_id_from ON traceroute (packet_id, from_node_id);
CREATE INDEX IF NOT EXISTS idx_traceroute_import_time ON traceroute (import_time);
)SQL";

} // namespace

// ---------- lifecycle ----------

namespace {

std::atomic<uint64_t> g_next_generation{1};

// Per-thread cache: store generation -> that thread's connection.
std::unordered_map<uint64_t, void*>& thread_conns() {
  thread_local std::unordered_map<uint64_t, void*> conns;
  return conns;
}

StoreStatus exec_sql(sqlite3* db, const char* sql) {
  char* msg = nullptr;
  const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &msg);
  if (rc != SQLITE_OK) {
    LogLine(LogLevel::Warn, "sqlite_exec_failed").kv("reason", msg ? msg : sqlite3_errmsg(db));
  }
  sqlite3_free(msg);
  return status_of(rc);
}

} // namespace

SqliteStore::~SqliteStore() {
  close();
}

bool SqliteStore::open(const std::string& path, uint32_t busy_timeout_ms, std::string& err) {
  return open_impl(path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, busy_timeout_ms, err);
}

bool SqliteStore::open_readonly(const std::string& path, uint32_t busy_timeout_ms, std::string& err) {
  return open_impl(path, SQLITE_OPEN_READONLY, busy_timeout_ms, err);
}

/*
 * open_impl()
 * -----------
 * Opens the first connection on the calling thread. A read-write open
 * also switches a file database to WAL (persistent in the file) and
 * applies the schema; later per-thread connections skip both.
 */
bool SqliteStore::open_impl(const std::string& path, int flags, uint32_t busy_timeout_ms, std::string& err) {
  close();
  path_            = path;
  flags_           = flags;
  busy_timeout_ms_ = busy_timeout_ms;
  shared_          = (path == ":memory:");

  auto first = std::make_unique<Conn>();
  if (!open_conn(first->db, err)) return false;

  if ((flags & SQLITE_OPEN_READWRITE) != 0) {
    if (!shared_ && exec_sql(first->db, "PRAGMA journal_mode=WAL") != StoreStatus::Ok) {
      LogLine(LogLevel::Warn, "sqlite_wal_unavailable").kv("path", path);
    }
    char* msg = nullptr;
    if (sqlite3_exec(first->db, SCHEMA_SQL, nullptr, nullptr, &msg) != SQLITE_OK) {
      err = std::string("failed to create schema: ") + (msg ? msg : sqlite3_errmsg(first->db));
      sqlite3_free(msg);
      return false;
    }
    sqlite3_free(msg);
  }

  const uint64_t gen = g_next_generation.fetch_add(1);
  {
    std::lock_guard<std::mutex> lk(pool_mu_);
    pool_.push_back(std::move(first));
    if (!shared_) thread_conns()[gen] = pool_.back().get();
  }
  generation_.store(gen);
  return true;
}

bool SqliteStore::open_conn(sqlite3*& db, std::string& err) const {
  // NOMUTEX: a connection is only ever used under its Conn::mu.
  const int rc = sqlite3_open_v2(path_.c_str(), &db, flags_ | SQLITE_OPEN_NOMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    err = std::string("cannot open database '") + path_ + "': " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    sqlite3_close(db);
    db = nullptr;
    return false;
  }
  sqlite3_busy_timeout(db, static_cast<int>(busy_timeout_ms_));
  if (!shared_ && (flags_ & SQLITE_OPEN_READWRITE) != 0) exec_sql(db, "PRAGMA synchronous=NORMAL");
  return true;
}

/*
 * connection()
 * ------------
 * OUT: the calling thread's connection, opened on first use; nullptr when
 *      the store is closed or the open failed (logged).
 */
SqliteStore::Conn* SqliteStore::connection() const {
  const uint64_t gen = generation_.load();
  if (gen == 0) return nullptr;
  if (shared_) return pool_.front().get();

  auto& cache = thread_conns();
  auto it = cache.find(gen);
  if (it != cache.end()) return static_cast<Conn*>(it->second);

  auto conn = std::make_unique<Conn>();
  std::string err;
  if (!open_conn(conn->db, err)) {
    LogLine(LogLevel::Error, "sqlite_open_failed").kv("reason", err);
    return nullptr;
  }
  Conn* raw = conn.get();
  {
    std::lock_guard<std::mutex> lk(pool_mu_);
    pool_.push_back(std::move(conn));
  }
  cache.emplace(gen, raw);
  return raw;
}

SqliteStore::Lease::Lease(const SqliteStore& store) : conn_(store.connection()) {
  if (conn_) lk_ = std::unique_lock<std::mutex>(conn_->mu);
}

void SqliteStore::close() {
  generation_.store(0);
  std::lock_guard<std::mutex> lk(pool_mu_);
  pool_.clear();                                  // ~Conn closes each handle
}

size_t SqliteStore::connection_count() const {
  std::lock_guard<std::mutex> lk(pool_mu_);
  return pool_.size();
}

// ---------- write side ----------

/*
 * record_packet()
 * ---------------
 * One short IMMEDIATE transaction:
 *   1) INSERT packet ... ON CONFLICT DO NOTHING        -> packet_inserted
 *   2) if not inserted and incoming is decoded:
 *      UPDATE packet ... WHERE encrypted = 1           -> packet_enriched
 *   3) INSERT packet_seen ... ON CONFLICT DO NOTHING   -> seen_inserted
 */
StoreStatus SqliteStore::record_packet(const Packet& packet, const PacketSeen& seen, RecordResult& out) {
  const Lease lease(*this);
  sqlite3* const db = lease.db();
  if (!db) return StoreStatus::Failed;

  Txn txn(db);
  if (txn.begun() != StoreStatus::Ok) return txn.begun();

  RecordResult rr;
  {
    Stmt s(db, "INSERT INTO packet (id, from_node_id, to_node_id, channel, portnum, payload, encrypted,"
               " want_response, request_id, import_time) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)"
               " ON CONFLICT (id, from_node_id) DO NOTHING");
    if (!s.ok()) return status_of(s.rc());
    s.i64(1, packet.key.packet_id);
    s.i64(2, packet.key.from);
    s.i64(3, packet.to);
    s.text(4, packet.channel.c_str());
    s.opt_i64(5, packet.portnum);
    s.blob(6, packet.payload);
    s.i64(7, packet.encrypted ? 1 : 0);
    s.i64(8, packet.want_response ? 1 : 0);
    s.i64(9, packet.request_id);
    s.i64(10, packet.import_time);
    if (s.step() != SQLITE_DONE) return status_of(s.rc());
    rr.packet_inserted = sqlite3_changes(db) > 0;
  }

  if (!rr.packet_inserted && !packet.encrypted && packet.portnum) {
    Stmt s(db, "UPDATE packet SET portnum = ?1, payload = ?2, encrypted = 0, want_response = ?3,"
               " request_id = ?4 WHERE id = ?5 AND from_node_id = ?6 AND encrypted = 1");
    if (!s.ok()) return status_of(s.rc());
    s.i64(1, *packet.portnum);
    s.blob(2, packet.payload);
    s.i64(3, packet.want_response ? 1 : 0);
    s.i64(4, packet.request_id);
    s.i64(5, packet.key.packet_id);
    s.i64(6, packet.key.from);
    if (s.step() != SQLITE_DONE) return status_of(s.rc());
    rr.packet_enriched = sqlite3_changes(db) > 0;
  }

  {
    Stmt s(db, "INSERT INTO packet_seen (packet_id, from_node_id, node_id, channel, topic, rx_snr, rx_rssi,"
               " hop_limit, hop_start, hop_count, rx_time, import_time)"
               " VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)"
               " ON CONFLICT (packet_id, from_node_id, node_id) DO NOTHING");
    if (!s.ok()) return status_of(s.rc());
    s.i64(1, seen.key.packet.packet_id);
    s.i64(2, seen.key.packet.from);
    s.i64(3, seen.key.gateway);
    s.text(4, seen.channel.c_str());
    s.text(5, seen.topic);
    s.opt_dbl(6, seen.rx_snr);
    s.opt_i64(7, seen.rx_rssi);
    s.i64(8, seen.hop_limit);
    s.i64(9, seen.hop_start);
    s.opt_i64(10, seen.hop_count);
    s.i64(11, seen.rx_time);
    s.i64(12, seen.import_time);
    if (s.step() != SQLITE_DONE) return status_of(s.rc());
    rr.seen_inserted = sqlite3_changes(db) > 0;
  }

  const StoreStatus st = txn.commit();
  if (st == StoreStatus::Ok) out = rr;
  return st;
}

/*
 * merge_node()
 * ------------
 * POLICY: each field is its own conditional UPDATE (timestamp CAS); the
 *         whole observation commits atomically.
 */
StoreStatus SqliteStore::merge_node(const NodeObservation& obs) {
  const Lease lease(*this);
  sqlite3* const db = lease.db();
  if (!db) return StoreStatus::Failed;

  Txn txn(db);
  if (txn.begun() != StoreStatus::Ok) return txn.begun();

  {
    Stmt s(db, "INSERT INTO node (node_id, last_seen) VALUES (?1, ?2)"
               " ON CONFLICT (node_id) DO UPDATE SET last_seen = MAX(last_seen, excluded.last_seen)");
    if (!s.ok()) return status_of(s.rc());
    s.i64(1, obs.node_id);
    s.i64(2, obs.observed_at);
    if (s.step() != SQLITE_DONE) return status_of(s.rc());
  }

  // cas() — bind value columns via @p bind starting at ?3; ?1 = node id, ?2 = observed_at.
  auto cas = [&](const char* sql, const auto& bind) -> StoreStatus {
    Stmt s(db, sql);
    if (!s.ok()) return status_of(s.rc());
    s.i64(1, obs.node_id);
    s.i64(2, obs.observed_at);
    bind(s);
    return status_of(s.step());
  };

  StoreStatus st = StoreStatus::Ok;
  auto run = [&st](StoreStatus r) { if (st == StoreStatus::Ok) st = r; };

  if (obs.long_name) {
    run(cas("UPDATE node SET long_name = ?3, long_name_at = ?2 WHERE node_id = ?1"
            " AND (long_name_at IS NULL OR long_name_at <= ?2)",
            [&](Stmt& s) { s.text(3, obs.long_name->c_str()); }));
  }
  if (obs.short_name) {
    run(cas("UPDATE node SET short_name = ?3, short_name_at = ?2 WHERE node_id = ?1"
            " AND (short_name_at IS NULL OR short_name_at <= ?2)",
            [&](Stmt& s) { s.text(3, obs.short_name->c_str()); }));
  }
  if (obs.hw_model) {
    run(cas("UPDATE node SET hw_model = ?3, hw_model_at = ?2 WHERE node_id = ?1"
            " AND (hw_model_at IS NULL OR hw_model_at <= ?2)",
            [&](Stmt& s) { s.i64(3, *obs.hw_model); }));
  }
  if (obs.role) {
    run(cas("UPDATE node SET role = ?3, role_at = ?2 WHERE node_id = ?1"
            " AND (role_at IS NULL OR role_at <= ?2)",
            [&](Stmt& s) { s.i64(3, *obs.role); }));
  }
  if (obs.firmware) {
    run(cas("UPDATE node SET firmware = ?3, firmware_at = ?2 WHERE node_id = ?1"
            " AND (firmware_at IS NULL OR firmware_at <= ?2)",
            [&](Stmt& s) { s.text(3, obs.firmware->c_str()); }));
  }
  if (obs.channel) {
    run(cas("UPDATE node SET channel = ?3, channel_at = ?2 WHERE node_id = ?1"
            " AND (channel_at IS NULL OR channel_at <= ?2)",
            [&](Stmt& s) { s.text(3, obs.channel->c_str()); }));
  }
  if (obs.position) {
    run(cas("UPDATE node SET lat = ?3, lon = ?4, alt = ?5, position_at = ?2 WHERE node_id = ?1"
            " AND (position_at IS NULL OR position_at <= ?2)",
            [&](Stmt& s) {
              s.dbl(3, obs.position->lat);
              s.dbl(4, obs.position->lon);
              s.opt_i64(5, obs.position->altitude);
            }));
  }
  if (obs.device_metrics) {
    const DeviceMetrics& d = *obs.device_metrics;
    run(cas("UPDATE node SET battery_level = ?3, voltage = ?4, channel_utilization = ?5, air_util_tx = ?6,"
            " uptime_seconds = ?7, device_at = ?2 WHERE node_id = ?1"
            " AND (device_at IS NULL OR device_at <= ?2)",
            [&](Stmt& s) {
              s.opt_i64(3, d.battery_level);
              s.opt_dbl(4, d.voltage);
              s.opt_dbl(5, d.channel_utilization);
              s.opt_dbl(6, d.air_util_tx);
              s.opt_i64(7, d.uptime_seconds);
            }));
  }
  if (obs.environment_metrics) {
    const EnvironmentMetrics& e = *obs.environment_metrics;
    run(cas("UPDATE node SET temperature = ?3, relative_humidity = ?4, barometric_pressure = ?5,"
            " gas_resistance = ?6, iaq = ?7, wind_direction = ?8, wind_speed = ?9, environment_at = ?2"
            " WHERE node_id = ?1 AND (environment_at IS NULL OR environment_at <= ?2)",
            [&](Stmt& s) {
              s.opt_dbl(3, e.temperature);
              s.opt_dbl(4, e.relative_humidity);
              s.opt_dbl(5, e.barometric_pressure);
              s.opt_dbl(6, e.gas_resistance);
              s.opt_i64(7, e.iaq);
              s.opt_i64(8, e.wind_direction);
              s.opt_dbl(9, e.wind_speed);
            }));
  }

  if (st != StoreStatus::Ok) return st;           // Txn dtor rolls back
  return txn.commit();
}

StoreStatus SqliteStore::update_traceroute(const PacketKey& key, const TraceMutator& fn) {
  const Lease lease(*this);
  sqlite3* const db = lease.db();
  if (!db) return StoreStatus::Failed;

  Txn txn(db);
  if (txn.begun() != StoreStatus::Ok) return txn.begun();

  Traceroute rec;
  bool exists = false;
  {
    const std::string sql = std::string(TRACE_SELECT) + " WHERE packet_id = ?1 AND from_node_id = ?2";
    Stmt s(db, sql.c_str());
    if (!s.ok()) return status_of(s.rc());
    s.i64(1, key.packet_id);
    s.i64(2, key.from);
    const int rc = s.step();
    if (rc == SQLITE_ROW) { rec = read_trace(s); exists = true; }
    else if (rc != SQLITE_DONE) return status_of(rc);
  }
  rec.key = key;

  if (!fn(rec, exists)) return StoreStatus::Ok;    // nothing to write; Txn rolls back the empty txn

  {
    Stmt s(db, "INSERT INTO traceroute (packet_id, from_node_id, target, gateway, route, snr_towards,"
               " route_back, snr_back, done, import_time, updated_at)"
               " VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)"
               " ON CONFLICT (packet_id, from_node_id) DO UPDATE SET target = excluded.target,"
               " gateway = excluded.gateway, route = excluded.route, snr_towards = excluded.snr_towards,"
               " route_back = excluded.route_back, snr_back = excluded.snr_back, done = excluded.done,"
               " updated_at = excluded.updated_at");
    if (!s.ok()) return status_of(s.rc());
    s.i64(1, key.packet_id);
    s.i64(2, key.from);
    s.i64(3, rec.target);
    s.i64(4, rec.gateway);
    s.text(5, route_json(rec.route));
    s.text(6, snr_json(rec.snr_towards));
    s.text(7, route_json(rec.route_back));
    s.text(8, snr_json(rec.snr_back));
    s.i64(9, rec.done ? 1 : 0);
    s.i64(10, rec.import_time);
    s.i64(11, rec.updated_at);
    if (s.step() != SQLITE_DONE) return status_of(s.rc());
  }
  return txn.commit();
}

// ---------- read side ----------

std::optional<Node> SqliteStore::get_node(NodeNum id) const {
  const Lease lease(*this);
  sqlite3* const db = lease.db();
  if (!db) return std::nullopt;
  const std::string sql = std::string(NODE_SELECT) + " WHERE node_id = ?1";
  Stmt s(db, sql.c_str());
  if (!s.ok()) return std::nullopt;
  s.i64(1, id);
  if (s.step() != SQLITE_ROW) return std::nullopt;
  return read_node(s);
}

std::vector<Node> SqliteStore::list_nodes() const {
  const Lease lease(*this);
  sqlite3* const db = lease.db();
  std::vector<Node> out;
  if (!db) return out;
  const std::string sql = std::string(NODE_SELECT) + " ORDER BY node_id";
  Stmt s(db, sql.c_str());
  if (!s.ok()) return out;
  while (s.step() == SQLITE_ROW) out.push_back(read_node(s));
  return out;
}

std::optional<Packet> SqliteStore::get_packet(const PacketKey& key) const {
  const Lease lease(*this);
  sqlite3* const db = lease.db();
  if (!db) return std::nullopt;
  const std::string sql = std::string(PACKET_SELECT) + " WHERE id = ?1 AND from_node_id = ?2";
  Stmt s(db, sql.c_str());
  if (!s.ok()) return std::nullopt;
  s.i64(1, key.packet_id);
  s.i64(2, key.from);
  if (s.step() != SQLITE_ROW) return std::nullopt;
  return read_packet(s);
}

std::vector<PacketSeen> SqliteStore::packets_seen(const PacketKey& key) const {
  const Lease lease(*this);
  sqlite3* const db = lease.db();
  std::vector<PacketSeen> out;
  if (!db) return out;
  Stmt s(db, "SELECT packet_id, from_node_id, node_id, channel, topic, rx_snr, rx_rssi, hop_limit,"
             " hop_start, hop_count, rx_time, import_time FROM packet_seen"
             " WHERE packet_id = ?1 AND from_node_id = ?2 ORDER BY import_time, node_id");
  if (!s.ok()) return out;
  s.i64(1, key.packet_id);
  s.i64(2, key.from);
  while (s.step() == SQLITE_ROW) {
    PacketSeen r;
    r.key.packet.packet_id = static_cast<PacketId>(s.col_i64(0));
    r.key.packet.from      = static_cast<NodeNum>(s.col_i64(1));
    r.key.gateway          = static_cast<NodeNum>(s.col_i64(2));
    r.channel              = ChannelStr(s.col_text(3).c_str());
    r.topic                = s.col_text(4);
    r.rx_snr               = s.col_opt<float>(5);
    r.rx_rssi              = s.col_opt<int32_t>(6);
    r.hop_limit            = static_cast<uint32_t>(s.col_i64(7));
    r.hop_start            = static_cast<uint32_t>(s.col_i64(8));
    r.hop_count            = s.col_opt<uint32_t>(9);
    r.rx_time              = static_cast<uint32_t>(s.col_i64(10));
    r.import_time          = s.col_i64(11);
    out.push_back(r);
  }
  return out;
}

std::optional<Traceroute> SqliteStore::get_traceroute(const PacketKey& key) const {
  const Lease lease(*this);
  sqlite3* const db = lease.db();
  if (!db) return std::nullopt;
  const std::string sql = std::string(TRACE_SELECT) + " WHERE packet_id = ?1 AND from_node_id = ?2";
  Stmt s(db, sql.c_str());
  if (!s.ok()) return std::nullopt;
  s.i64(1, key.packet_id);
  s.i64(2, key.from);
  if (s.step() != SQLITE_ROW) return std::nullopt;
  return read_trace(s);
}

std::vector<Traceroute> SqliteStore::traceroutes_since(TimeUs since) const {
  const Lease lease(*this);
  sqlite3* const db = lease.db();
  std::vector<Traceroute> out;
  if (!db) return out;
  const std::string sql = std::string(TRACE_SELECT) +
                          " WHERE import_time >= ?1 ORDER BY import_time, packet_id, from_node_id";
  Stmt s(db, sql.c_str());
  if (!s.ok()) return out;
  s.i64(1, since);
  while (s.step() == SQLITE_ROW) out.push_back(read_trace(s));
  return out;
}

std::vector<Packet> SqliteStore::packets_since(TimeUs since, std::optional<uint32_t> portnum) const {
  const Lease lease(*this);
  sqlite3* const db = lease.db();
  std::vector<Packet> out;
  if (!db) return out;
  const std::string sql = std::string(PACKET_SELECT) +
                          (portnum ? " WHERE import_time >= ?1 AND portnum = ?2" : " WHERE import_time >= ?1") +
                          " ORDER BY import_time, id, from_node_id";
  Stmt s(db, sql.c_str());
  if (!s.ok()) return out;
  s.i64(1, since);
  if (portnum) s.i64(2, *portnum);
  while (s.step() == SQLITE_ROW) out.push_back(read_packet(s));
  return out;
}

/*
 * top_traffic()
 * -------------
 * The window filter hits idx_packet_import_time; the join hits the
 * packet_seen primary key / idx_packet_seen_packet_id.
 */
std::vector<TrafficRow> SqliteStore::top_traffic(TimeUs since, size_t limit) const {
  const Lease lease(*this);
  sqlite3* const db = lease.db();
  std::vector<TrafficRow> out;
  if (!db) return out;
  Stmt s(db, "SELECT p.from_node_id, n.long_name, n.short_name,"
             " COUNT(DISTINCT p.id) AS packets_sent, COUNT(ps.packet_id) AS times_seen"
             " FROM packet p"
             " LEFT JOIN packet_seen ps ON ps.packet_id = p.id AND ps.from_node_id = p.from_node_id"
             " LEFT JOIN node n ON n.node_id = p.from_node_id"
             " WHERE p.import_time >= ?1"
             " GROUP BY p.from_node_id"
             " ORDER BY times_seen DESC, p.from_node_id ASC"
             " LIMIT ?2");
  if (!s.ok()) return out;
  s.i64(1, since);
  s.i64(2, limit ? static_cast<int64_t>(limit) : -1);   // -1 = no limit
  while (s.step() == SQLITE_ROW) {
    TrafficRow r;
    r.node_id      = static_cast<NodeNum>(s.col_i64(0));
    r.long_name    = s.col_text(1);
    r.short_name   = s.col_text(2);
    r.packets_sent = static_cast<uint64_t>(s.col_i64(3));
    r.times_seen   = static_cast<uint64_t>(s.col_i64(4));
    out.push_back(r);
  }
  return out;
}

std::vector<PortCount> SqliteStore::node_traffic(NodeNum id, TimeUs since) const {
  const Lease lease(*this);
  sqlite3* const db = lease.db();
  std::vector<PortCount> out;
  if (!db) return out;
  Stmt s(db, "SELECT portnum, COUNT(*) AS c FROM packet"
             " WHERE from_node_id = ?1 AND import_time >= ?2 AND portnum IS NOT NULL"
             " GROUP BY portnum ORDER BY c DESC, portnum ASC");
  if (!s.ok()) return out;
  s.i64(1, id);
  s.i64(2, since);
  while (s.step() == SQLITE_ROW) {
    out.push_back(PortCount{static_cast<uint32_t>(s.col_i64(0)), static_cast<uint64_t>(s.col_i64(1))});
  }
  return out;
}

StoreCounts SqliteStore::counts() const {
  const Lease lease(*this);
  sqlite3* const db = lease.db();
  StoreCounts c;
  if (!db) return c;
  auto count = [&](const char* sql) -> uint64_t {
    Stmt s(db, sql);
    if (!s.ok() || s.step() != SQLITE_ROW) return 0;
    return static_cast<uint64_t>(s.col_i64(0));
  };
  c.nodes        = count("SELECT COUNT(*) FROM node");
  c.packets      = count("SELECT COUNT(*) FROM packet");
  c.packets_seen = count("SELECT COUNT(*) FROM packet_seen");
  c.traceroutes  = count("SELECT COUNT(*) FROM traceroute");
  return c;
}

std::vector<std::string> SqliteStore::index_names() const {
  const Lease lease(*this);
  sqlite3* const db = lease.db();
  std::vector<std::string> out;
  if (!db) return out;
  Stmt s(db, "SELECT name FROM sqlite_master WHERE type = 'index' AND name NOT LIKE 'sqlite_%' ORDER BY name");
  if (!s.ok()) return out;
  while (s.step() == SQLITE_ROW) out.push_back(s.col_text(0));
  return out;
}

} // namespace meshview
