#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "CLI/CLI.hpp"
#include <nlohmann/json.hpp>

#include "meshview/bounded_queue.hpp"
#include "meshview/channel_keys.hpp"
#include "meshview/config.hpp"
#include "meshview/health.hpp"
#include "meshview/listener.hpp"
#include "meshview/live_hub.hpp"
#include "meshview/log.hpp"
#include "meshview/memory_store.hpp"
#include "meshview/pipeline.hpp"
#include "config_file.hpp"        // load_config_file(), build_channel_keys()
#include "json_format.hpp"        // to_json() for events and the health snapshot
#include "mosquitto_client.hpp"   // MosquittoClient
#include "sqlite_store.hpp"       // SqliteStore

using namespace meshview;

static std::atomic<bool> g_stop{false};

extern "C" void on_signal(int) { g_stop.store(true); }

int main(int argc, char** argv) {
  CLI::App app{"MeshView ingest daemon"};

  // ---- config file + overrides ----
  std::string config_path;
  std::string host, store_path, log_level_s, client_id;
  int port = 0;
  unsigned workers = 0;
  std::vector<std::string> topics;
  bool print_events = false;

  app.add_option("--config", config_path, "JSON config file (every key optional)");
  app.add_option("--host", host, "Broker host (overrides mqtt.host)");
  app.add_option("--port", port, "Broker port (overrides mqtt.port)")->check(CLI::Range(1, 65535));
  app.add_option("--client-id", client_id, "MQTT client id (overrides mqtt.client_id)");
  app.add_option("--topic", topics, "Topic filter, repeatable (overrides mqtt.topics)");
  app.add_option("--store", store_path, "SQLite path, ':memory:', or 'memory' for the in-process store");
  app.add_option("--log-level", log_level_s, "debug|info|warn|error");
  app.add_option("--workers", workers, "Decode/store worker threads")->check(CLI::Range(1u, 64u));
  app.add_flag("--events", print_events, "Print live events to stdout as JSON lines");

  CLI11_PARSE(app, argc, argv);

  // -------- configuration --------
  Config cfg;
  std::string err;
  if (!config_path.empty() && !load_config_file(config_path, cfg, err)) {
    std::cerr << "status=error reason=config_invalid detail=\"" << err << "\"\n";
    return 2;
  }
  if (!host.empty())       cfg.mqtt.broker.host = host;
  if (port > 0)            cfg.mqtt.broker.port = static_cast<uint16_t>(port);
  if (!client_id.empty())  cfg.mqtt.broker.client_id = client_id;
  if (!topics.empty())     cfg.mqtt.topics = topics;
  if (!store_path.empty()) cfg.store.path = store_path;
  if (workers > 0)         cfg.pipeline.workers = workers;
  if (!log_level_s.empty()) {
    const auto lvl = parse_log_level(log_level_s);
    if (!lvl) {
      std::cerr << "status=error reason=bad_log_level value=" << log_level_s << "\n";
      return 2;
    }
    cfg.log_level = *lvl;
  }
  set_log_level(cfg.log_level);

  ChannelKeys keys;
  if (!build_channel_keys(cfg, keys, err)) {
    std::cerr << "status=error reason=bad_channel_key detail=\"" << err << "\"\n";
    return 2;
  }

  // -------- store --------
  std::unique_ptr<Store> store;
  if (cfg.store.path == "memory") {
    store = std::make_unique<MemoryStore>();
  } else {
    auto sql = std::make_unique<SqliteStore>();
    if (!sql->open(cfg.store.path, cfg.store.busy_timeout_ms, err)) {
      std::cerr << "status=error reason=store_open_failed detail=\"" << err << "\"\n";
      return 3;
    }
    store = std::move(sql);
  }

  // -------- wiring: listener -> raw queue -> workers -> store / hub --------
  LiveHub hub(cfg.live.subscriber_capacity);
  PipelineCounters counters;
  BoundedQueue<RawMessage> raw(cfg.pipeline.raw_queue_capacity);
  Pipeline pipeline(cfg.pipeline, *store, keys, hub, counters);
  transport::MosquittoClient client;
  Listener listener(client, raw, cfg.mqtt);

  std::shared_ptr<Subscription> sub;
  std::thread printer;
  if (print_events) {
    sub = hub.subscribe();
    printer = std::thread([&sub] {
      NormalizedEvent ev;
      while (!sub->closed()) {
        if (sub->next(ev, std::chrono::milliseconds(200))) {
          std::cout << nlohmann::json(ev).dump() << "\n" << std::flush;
        }
      }
    });
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  LogLine(LogLevel::Info, "startup")
    .kv("broker", cfg.mqtt.broker.host + ":" + std::to_string(cfg.mqtt.broker.port))
    .kv("store", cfg.store.path).kv("workers", cfg.pipeline.workers).kv("channels", keys.size());

  pipeline.start(raw);
  listener.start();

  auto snapshot = [&] {
    HealthSnapshot h;
    fill_counters(counters, h);
    h.connection           = listener.state();
    h.connects             = listener.connects();
    h.connection_losses    = listener.connection_losses();
    h.received             = listener.received();
    h.raw_queue_drops      = raw.evictions();
    h.subscriber_evictions = hub.total_evictions();
    h.subscribers          = hub.subscriber_count();
    return h;
  };

  // -------- run until signalled --------
  const auto interval = std::chrono::seconds(cfg.health_interval_s);
  auto next_health = std::chrono::steady_clock::now() + interval;
  while (!g_stop.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    if (cfg.health_interval_s > 0 && std::chrono::steady_clock::now() >= next_health) {
      if (const size_t pruned = hub.prune()) {
        LogLine(LogLevel::Debug, "subscribers_pruned").kv("count", pruned);
      }
      log_health(snapshot());
      next_health += interval;
    }
  }

  // -------- shutdown: stop intake, drain workers, then readers --------
  LogLine(LogLevel::Info, "shutdown");
  listener.stop();
  pipeline.stop();
  if (sub) {
    hub.unsubscribe(sub);
    if (printer.joinable()) printer.join();
  }

  const HealthSnapshot final_h = snapshot();
  log_health(final_h);
  std::cout << nlohmann::json{{"health", final_h}}.dump() << "\n";
  return final_h.degraded ? 1 : 0;
}
