/**
 * @file memory_store.hpp
 * @brief In-process Store backend with per-key striped locking.
 *
 * @details
 * Used by the test suite and by `meshview-ingest --store memory` for dry
 * runs against a live broker. Each entity family lives in its own
 * ShardedMap; a Packet and all of its PacketSeen rows share one entry so the
 * two upserts of record_packet() happen under a single shard lock.
 *
 * Never returns StoreStatus::Busy. An optional fault hook lets tests inject
 * Busy/Failed results to exercise the pipeline's retry budget.
 */

#ifndef MESHVIEW_MEMORY_STORE_HPP
#define MESHVIEW_MEMORY_STORE_HPP

#include <atomic>
#include <functional>
#include <vector>

#include "meshview/store.hpp"
#include "meshview/keyed_shards.hpp"

namespace meshview {

class MemoryStore : public Store {
public:
  /// Called before every write; a non-Ok result is returned instead of writing.
  using FaultHook = std::function<StoreStatus()>;

  MemoryStore() = default;

  void set_fault_hook(FaultHook hook) { fault_hook_ = std::move(hook); }

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

  /// Number of write calls that reached the backend (tests check "zero store writes").
  uint64_t write_calls() const { return write_calls_.load(); }

private:
  struct PacketEntry {
    Packet packet;
    std::vector<PacketSeen> seen;
  };

  StoreStatus fault() const;

  ShardedMap<PacketKey, PacketEntry> packets_;
  ShardedMap<NodeNum, Node>          nodes_;
  ShardedMap<PacketKey, Traceroute>  traces_;
  FaultHook fault_hook_;
  std::atomic<uint64_t> write_calls_{0};
};

} // namespace meshview

#endif // MESHVIEW_MEMORY_STORE_HPP
