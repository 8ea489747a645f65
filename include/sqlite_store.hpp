#pragma once
/**
 * @page mv-sqlite-store SQLite Store
 * @file sqlite_store.hpp
 * @brief Persistent Store backend on SQLite (WAL mode).
 *
 * @details
 * PURPOSE
 * -------
 * Durable home for the four ingestion tables so the query CLI (and any
 * presentation layer) can read them while the daemon keeps writing.
 *
 * SCHEMA
 * ------
 * | table        | primary key                              | notes                              |
 * |--------------|------------------------------------------|------------------------------------|
 * | node         | node_id                                  | every field has a `<field>_at`     |
 * | packet       | (id, from_node_id)                       | portnum NULL while encrypted = 1   |
 * | packet_seen  | (packet_id, from_node_id, node_id)       | node_id = reporting gateway        |
 * | traceroute   | (packet_id, from_node_id)                | routes stored as JSON arrays       |
 *
 * Indexes: `packet(from_node_id, import_time DESC)`, `packet(import_time)`,
 * `packet_seen(packet_id)`, `traceroute(packet_id, from_node_id)`.
 *
 * HOW THE WRITE CONTRACT MAPS
 * ---------------------------
 * - upsert-if-absent:  `INSERT ... ON CONFLICT DO NOTHING` + `sqlite3_changes()`.
 * - opaque enrichment: `UPDATE packet ... WHERE encrypted = 1`.
 * - field CAS:         `UPDATE node SET f = ?, f_at = ? WHERE node_id = ? AND (f_at IS NULL OR f_at <= ?)`.
 * - traceroute RMW:    `BEGIN IMMEDIATE`, select, mutate, upsert, `COMMIT`.
 *
 * CONCURRENCY
 * -----------
 * Every thread gets its own connection, opened on its first call and kept
 * until close(). WAL lets those connections read while one of them holds
 * the single SQLite write lock; writers queue on that lock through
 * busy_timeout, and unrelated reads never wait on a process-wide mutex.
 * `SQLITE_BUSY` / `SQLITE_LOCKED` past busy_timeout map to
 * StoreStatus::Busy so the pipeline retries.
 *
 * `":memory:"` is one private database, so all threads share its single
 * connection and take turns on its mutex.
 *
 * open() and close() must not race with calls from other threads.
 *
 * OPERATIONAL NOTES
 * -----------------
 * - `":memory:"` opens a private in-memory database (tests).
 * - `open_readonly()` is what meshview-query uses; writes then fail.
 */

#include <sqlite3.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "meshview/store.hpp"

namespace meshview {

class SqliteStore : public Store {
public:
  SqliteStore() = default;
  ~SqliteStore() override;

  SqliteStore(const SqliteStore&) = delete;
  SqliteStore& operator=(const SqliteStore&) = delete;

  /// Open (creating if needed) and apply the schema. False + err on failure.
  bool open(const std::string& path, uint32_t busy_timeout_ms, std::string& err);
  /// Open an existing database for reading only.
  bool open_readonly(const std::string& path, uint32_t busy_timeout_ms, std::string& err);
  void close();
  bool is_open() const { return generation_.load() != 0; }

  StoreStatus record_packet(const Packet& packet, const PacketSeen& seen, RecordResult& out) override;
  StoreStatus merge_node(const NodeObservation& obs) override;
  StoreStatus update_traceroute(const PacketKey& key, const TraceMutator& fn) override;

  std::optional<Node>       get_node(NodeNum id) const override;
  std::vector<Node>         list_nodes() const override;
  std::optional<Packet>     get_packet(const PacketKey& key) const override;
  std::vector<PacketSeen>   packets_seen(const PacketKey& key) const override;
  std::optional<Traceroute> get_traceroute(const PacketKey& key) const override;
  std::vector<Traceroute>   traceroutes_since(TimeUs since) const override;
  std::vector<Packet>       packets_since(TimeUs since, std::optional<uint32_t> portnum) const override;
  std::vector<TrafficRow>   top_traffic(TimeUs since, size_t limit) const override;
  std::vector<PortCount>    node_traffic(NodeNum id, TimeUs since) const override;
  StoreCounts               counts() const override;

  /// Names of the user indexes present (schema checks in tests).
  std::vector<std::string> index_names() const;

  /// Connections opened so far (one per calling thread, or one when shared).
  size_t connection_count() const;

private:
  struct Conn {
    sqlite3*   db{nullptr};
    std::mutex mu;
    ~Conn() { if (db) sqlite3_close(db); }
  };

  // Lease — the calling thread's connection, locked for one store call.
  class Lease {
  public:
    explicit Lease(const SqliteStore& store);
    sqlite3* db() const { return conn_ ? conn_->db : nullptr; }

  private:
    Conn* conn_;
    std::unique_lock<std::mutex> lk_;
  };

  bool open_impl(const std::string& path, int flags, uint32_t busy_timeout_ms, std::string& err);
  bool open_conn(sqlite3*& db, std::string& err) const;
  Conn* connection() const;

  std::string path_;
  int         flags_{0};
  uint32_t    busy_timeout_ms_{0};
  bool        shared_{false};                   // ":memory:": one connection for all threads
  std::atomic<uint64_t> generation_{0};         // 0 = closed; new value per open

  mutable std::mutex pool_mu_;                  // guards pool_ growth only
  mutable std::vector<std::unique_ptr<Conn>> pool_;
};

} // namespace meshview
