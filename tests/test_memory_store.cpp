#include <doctest/doctest.h>
#include "meshview/memory_store.hpp"
#include "store_contract.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace meshview;
using namespace mvtest;

TEST_CASE("MemoryStore: dedup by packet identity and gateway") {
    MemoryStore st;
    check_dedup_contract(st);
}

TEST_CASE("MemoryStore: opaque packet is enriched once, never overwritten") {
    MemoryStore st;
    check_enrichment_contract(st);
}

TEST_CASE("MemoryStore: node fields merge by observation time") {
    MemoryStore st;
    check_node_merge_contract(st);
}

TEST_CASE("MemoryStore: traceroute read-modify-write") {
    MemoryStore st;
    check_traceroute_contract(st);
}

TEST_CASE("MemoryStore: traffic tables") {
    MemoryStore st;
    check_traffic_contract(st);
}

TEST_CASE("MemoryStore: fault hook surfaces Busy without writing") {
    MemoryStore st;
    st.set_fault_hook([] { return StoreStatus::Busy; });
    RecordResult rr;
    CHECK(record(st, 1, 0x1, 0xA, 10, rr) == StoreStatus::Busy);
    CHECK(st.counts().packets == 0u);
    CHECK(st.write_calls() == 1u);

    st.set_fault_hook(nullptr);
    CHECK(record(st, 1, 0x1, 0xA, 10, rr) == StoreStatus::Ok);
    CHECK(st.counts().packets == 1u);
}

TEST_CASE("MemoryStore: concurrent reports of one packet create exactly one canonical row") {
    MemoryStore st;
    constexpr int kThreads = 8;
    std::atomic<int> inserted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&st, &inserted, i] {
            RecordResult rr;
            record(st, 4242, 0x9, static_cast<NodeNum>(0x100 + i), 10 + i, rr);
            if (rr.packet_inserted) ++inserted;
        });
    }
    for (auto& t : threads) t.join();

    CHECK(inserted.load() == 1);
    CHECK(st.counts().packets == 1u);
    CHECK(st.packets_seen(PacketKey{4242, 0x9}).size() == static_cast<size_t>(kThreads));
}
