#include <doctest/doctest.h>
#include "sqlite_store.hpp"
#include "store_contract.hpp"

#include <algorithm>
#include <functional>
#include <cmath>
#include <cstdio>
#include <limits>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace meshview;
using namespace mvtest;

static void open_memory(SqliteStore& st) {
    std::string err;
    REQUIRE_MESSAGE(st.open(":memory:", 1000, err), err);
}

TEST_CASE("SqliteStore: schema carries the lookup indexes") {
    SqliteStore st;
    open_memory(st);
    const auto idx = st.index_names();
    auto has = [&](const char* name) { return std::find(idx.begin(), idx.end(), name) != idx.end(); };
    CHECK(has("idx_packet_from_node_id_import_time"));
    CHECK(has("idx_packet_import_time"));
    CHECK(has("idx_packet_seen_packet_id"));
    CHECK(has("idx_traceroute_packet_id_from"));
}

TEST_CASE("SqliteStore: dedup by packet identity and gateway") {
    SqliteStore st;
    open_memory(st);
    check_dedup_contract(st);
}

TEST_CASE("SqliteStore: opaque packet is enriched once, never overwritten") {
    SqliteStore st;
    open_memory(st);
    check_enrichment_contract(st);
}

TEST_CASE("SqliteStore: node fields merge by observation time") {
    SqliteStore st;
    open_memory(st);
    check_node_merge_contract(st);
}

TEST_CASE("SqliteStore: traceroute read-modify-write") {
    SqliteStore st;
    open_memory(st);
    check_traceroute_contract(st);
}

TEST_CASE("SqliteStore: traffic tables") {
    SqliteStore st;
    open_memory(st);
    check_traffic_contract(st);
}

TEST_CASE("SqliteStore: unknown SNR hops survive the JSON column as NaN") {
    SqliteStore st;
    open_memory(st);
    const PacketKey key{5, 0x1};
    REQUIRE(st.update_traceroute(key, [](Traceroute& t, bool) {
        t.route = {0x1, 0x2, 0x3};
        t.snr_towards = {1.0f, std::numeric_limits<float>::quiet_NaN()};
        t.import_time = 1;
        return true;
    }) == StoreStatus::Ok);

    const auto t = st.get_traceroute(key);
    REQUIRE(t.has_value());
    REQUIRE(t->snr_towards.size() == 2);
    CHECK(t->snr_towards[0] == doctest::Approx(1.0));
    CHECK(std::isnan(t->snr_towards[1]));
}

TEST_CASE("SqliteStore: a read-only handle sees committed rows and refuses writes") {
    char path[] = "/tmp/meshview_test_XXXXXX";
    const int fd = mkstemp(path);
    REQUIRE(fd >= 0);
    close(fd);

    std::string err;
    {
        SqliteStore writer;
        REQUIRE_MESSAGE(writer.open(path, 1000, err), err);
        RecordResult rr;
        REQUIRE(record(writer, 1, 0x1, 0xA, 10, rr) == StoreStatus::Ok);
    }

    SqliteStore reader;
    REQUIRE_MESSAGE(reader.open_readonly(path, 1000, err), err);
    CHECK(reader.get_packet(PacketKey{1, 0x1}).has_value());
    RecordResult rr;
    CHECK(record(reader, 2, 0x1, 0xA, 20, rr) == StoreStatus::Failed);
    reader.close();

    std::remove(path);
    std::remove((std::string(path) + "-wal").c_str());
    std::remove((std::string(path) + "-shm").c_str());
}

TEST_CASE("SqliteStore: opening a missing database read-only fails with a reason") {
    SqliteStore st;
    std::string err;
    CHECK_FALSE(st.open_readonly("/nonexistent/dir/meshview.db", 100, err));
    CHECK_FALSE(err.empty());
    CHECK_FALSE(st.is_open());
}

// Writers on separate connections can still see the write lock held past
// busy_timeout; retry the way the pipeline does.
static StoreStatus until_not_busy(const std::function<StoreStatus()>& fn) {
    StoreStatus st = fn();
    for (int i = 0; i < 50 && st == StoreStatus::Busy; ++i) st = fn();
    return st;
}

static void hammer_distinct_keys(SqliteStore& st, int threads, int per_thread) {
    std::vector<std::thread> pool;
    std::vector<int> failures(static_cast<size_t>(threads), 0);
    for (int t = 0; t < threads; ++t) {
        pool.emplace_back([&st, &failures, t, per_thread] {
            const NodeNum from = static_cast<NodeNum>(0x1000 + t);
            for (int i = 0; i < per_thread; ++i) {
                RecordResult rr;
                const PacketId id = static_cast<PacketId>(i + 1);
                if (until_not_busy([&] { return record(st, id, from, 0xA, 10 + i, rr); }) != StoreStatus::Ok) {
                    ++failures[static_cast<size_t>(t)];
                }
                NodeObservation obs;
                obs.node_id = from;
                obs.observed_at = 10 + i;
                obs.long_name = LongNameStr("worker");
                if (until_not_busy([&] { return st.merge_node(obs); }) != StoreStatus::Ok) {
                    ++failures[static_cast<size_t>(t)];
                }
                if (!st.get_node(from)) ++failures[static_cast<size_t>(t)];
            }
        });
    }
    for (auto& th : pool) th.join();
    for (int f : failures) CHECK(f == 0);
}

TEST_CASE("SqliteStore: threads writing distinct keys each get a connection and lose nothing") {
    char path[] = "/tmp/meshview_mt_XXXXXX";
    const int fd = mkstemp(path);
    REQUIRE(fd >= 0);
    close(fd);

    {
        SqliteStore st;
        std::string err;
        REQUIRE_MESSAGE(st.open(path, 5000, err), err);

        hammer_distinct_keys(st, 4, 25);

        const StoreCounts c = st.counts();
        CHECK(c.packets == 100u);
        CHECK(c.packets_seen == 100u);
        CHECK(c.nodes == 4u);
        CHECK(st.connection_count() == 5u);          // opening thread + one per worker

        const auto n = st.get_node(0x1002);
        REQUIRE(n.has_value());
        CHECK(n->last_seen == 34);
        CHECK(*n->long_name.value == LongNameStr("worker"));
    }

    std::remove(path);
    std::remove((std::string(path) + "-wal").c_str());
    std::remove((std::string(path) + "-shm").c_str());
}

TEST_CASE("SqliteStore: an in-memory database is shared by every thread through one connection") {
    SqliteStore st;
    open_memory(st);

    hammer_distinct_keys(st, 4, 10);

    CHECK(st.counts().packets == 40u);
    CHECK(st.counts().nodes == 4u);
    CHECK(st.connection_count() == 1u);
}

TEST_CASE("SqliteStore: a closed store refuses calls instead of touching a stale connection") {
    SqliteStore st;
    open_memory(st);
    st.close();
    CHECK_FALSE(st.is_open());
    RecordResult rr;
    CHECK(record(st, 1, 0x1, 0xA, 10, rr) == StoreStatus::Failed);
    CHECK_FALSE(st.get_node(0x1).has_value());
    CHECK(st.connection_count() == 0u);
}
