/**
 * @file main.cpp
 * @brief meshview-query — one-shot reader over the ingest daemon's SQLite store.
 *
 * Responsibilities:
 *  - Open the database read-only (WAL lets this run while meshview-ingest writes).
 *  - Expose the synchronous read contract as subcommands, one JSON document each:
 *      node <id> | nodes | packet <from> <id> | seen <from> <id> |
 *      traceroute <from> <id> | top | graph | traffic <id>
 *  - Report failures shell-style on stderr: `status=error reason=...`.
 *
 * Notes:
 *  - Node ids accept `!1a2b3c4d`, `0x1a2b3c4d` or decimal.
 *  - Windows (`--hours`) are measured back from the current wall clock.
 *  - Exit codes: 0 ok, 2 bad arguments, 3 store unavailable, 4 not found.
 */

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include "meshview/aggregators.hpp"
#include "meshview/listener.hpp"   // now_us()
#include "meshview/log.hpp"
#include "json_format.hpp"
#include "sqlite_store.hpp"

using json = nlohmann::json;
using namespace meshview;

// ---------- small utilities ----------

static bool parse_id_arg(const std::string& s, NodeNum& out) {
  const auto id = parse_node_id(s);
  if (!id) {
    std::cerr << "status=error reason=bad_node_id value=" << s << "\n";
    return false;
  }
  out = *id;
  return true;
}

static void print(const json& j, bool compact) {
  std::cout << (compact ? j.dump() : j.dump(2)) << "\n";
}

static int not_found(const char* what) {
  std::cerr << "status=error reason=not_found what=" << what << "\n";
  return 4;
}

int main(int argc, char** argv) {
  CLI::App app{"MeshView query tool"};
  app.require_subcommand(1);

  std::string db_path = "meshview.db";
  uint32_t busy_ms = 2000;
  bool compact = false;
  app.add_option("--db", db_path, "SQLite database written by meshview-ingest");
  app.add_option("--busy-timeout", busy_ms, "Milliseconds to wait on a locked database");
  app.add_flag("--compact", compact, "Single-line JSON");

  // ---- subcommands ----
  std::string node_arg, from_arg;
  uint32_t packet_id = 0;
  size_t limit = 20;
  double hours = 24.0;

  auto* c_node = app.add_subcommand("node", "One node's merged state");
  c_node->add_option("id", node_arg, "Node id")->required();

  auto* c_nodes = app.add_subcommand("nodes", "Every known node");

  auto* c_packet = app.add_subcommand("packet", "Canonical packet record");
  c_packet->add_option("from", from_arg, "Sender node id")->required();
  c_packet->add_option("packet_id", packet_id, "Mesh packet id")->required();

  auto* c_seen = app.add_subcommand("seen", "Gateway observations of one packet");
  c_seen->add_option("from", from_arg, "Sender node id")->required();
  c_seen->add_option("packet_id", packet_id, "Mesh packet id")->required();

  auto* c_trace = app.add_subcommand("traceroute", "Assembled path-trace (key = request)");
  c_trace->add_option("from", from_arg, "Requester node id")->required();
  c_trace->add_option("packet_id", packet_id, "Request packet id")->required();

  auto* c_top = app.add_subcommand("top", "Ranked traffic table");
  c_top->add_option("--limit", limit, "Rows (0 = all)");
  c_top->add_option("--hours", hours, "Window length")->check(CLI::PositiveNumber);

  auto* c_graph = app.add_subcommand("graph", "Topology edges (trace + neighbor)");
  c_graph->add_option("--hours", hours, "Window length")->check(CLI::PositiveNumber);

  auto* c_traffic = app.add_subcommand("traffic", "Packets per port for one node");
  c_traffic->add_option("id", node_arg, "Node id")->required();
  c_traffic->add_option("--hours", hours, "Window length")->check(CLI::PositiveNumber);

  CLI11_PARSE(app, argc, argv);

  // Warnings from the store go to stderr; stdout stays pure JSON.
  set_log_level(LogLevel::Warn);

  SqliteStore store;
  std::string err;
  if (!store.open_readonly(db_path, busy_ms, err)) {
    std::cerr << "status=error reason=store_open_failed detail=\"" << err << "\"\n";
    return 3;
  }

  const TimeUs now = now_us();
  const TimeUs window = static_cast<TimeUs>(hours * 3600.0 * 1e6);

  // -------- dispatch --------
  if (*c_node) {
    NodeNum id;
    if (!parse_id_arg(node_arg, id)) return 2;
    const auto n = store.get_node(id);
    if (!n) return not_found("node");
    print(*n, compact);
    return 0;
  }

  if (*c_nodes) {
    print(store.list_nodes(), compact);
    return 0;
  }

  if (*c_packet || *c_seen || *c_trace) {
    NodeNum from;
    if (!parse_id_arg(from_arg, from)) return 2;
    const PacketKey key{packet_id, from};

    if (*c_packet) {
      const auto p = store.get_packet(key);
      if (!p) return not_found("packet");
      print(json{{"packet", *p}, {"seen", store.packets_seen(key)}}, compact);
    } else if (*c_seen) {
      print(store.packets_seen(key), compact);
    } else {
      const auto t = store.get_traceroute(key);
      if (!t) return not_found("traceroute");
      print(*t, compact);
    }
    return 0;
  }

  if (*c_top) {
    print(top_traffic(store, now, limit, window), compact);
    return 0;
  }

  if (*c_graph) {
    print(build_graph(store, now - window), compact);
    return 0;
  }

  if (*c_traffic) {
    NodeNum id;
    if (!parse_id_arg(node_arg, id)) return 2;
    print(json{{"id", node_id_to_hex(id)}, {"ports", node_traffic(store, id, now, window)}}, compact);
    return 0;
  }

  std::cerr << "status=error reason=need_subcommand\n";
  return 2;
}
