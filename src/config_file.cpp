// ============================================================================
// config_file.cpp — implementation for config_file.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "config_file.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace meshview {

using nlohmann::json;

// Overlay helpers: keep the current value when the key is absent.
template <typename T>
static void take(const json& obj, const char* key, T& field) {
  if (obj.contains(key)) field = obj.at(key).get<T>();
}

static void apply_mqtt(const json& m, ListenerConfig& c) {
  take(m, "host",             c.broker.host);
  take(m, "port",             c.broker.port);
  take(m, "username",         c.broker.username);
  take(m, "password",         c.broker.password);
  take(m, "client_id",        c.broker.client_id);
  take(m, "keepalive_s",      c.broker.keepalive_s);
  take(m, "topics",           c.topics);
  take(m, "reconnect_min_ms", c.reconnect_min_ms);
  take(m, "reconnect_max_ms", c.reconnect_max_ms);
  take(m, "poll_timeout_ms",  c.poll_timeout_ms);
}

static void apply_pipeline(const json& p, PipelineConfig& c) {
  take(p, "raw_queue_capacity",       c.raw_queue_capacity);
  take(p, "workers",                  c.workers);
  take(p, "store_max_attempts",       c.store_max_attempts);
  take(p, "store_backoff_ms",         c.store_backoff_ms);
  take(p, "store_degraded_threshold", c.store_degraded_threshold);
  if (p.contains("ignore_from")) {
    c.ignore_from.clear();
    for (const auto& v : p.at("ignore_from")) {
      // numbers or "!hex" strings
      if (v.is_string()) {
        const auto id = parse_node_id(v.get<std::string>());
        if (!id) throw std::invalid_argument("bad node id in ignore_from: " + v.get<std::string>());
        c.ignore_from.insert(*id);
      } else {
        c.ignore_from.insert(v.get<NodeNum>());
      }
    }
  }
}

/*
 * parse_config()
 * --------------
 * POLICY: the document is applied section by section onto the caller's
 *         Config; on error @p cfg may be partly updated and must be discarded.
 */
bool parse_config(const std::string& text, Config& cfg, std::string& err) {
  try {
    const json j = json::parse(text);
    if (!j.is_object()) {
      err = "config root must be an object";
      return false;
    }
    if (j.contains("mqtt"))     apply_mqtt(j.at("mqtt"), cfg.mqtt);
    if (j.contains("pipeline")) apply_pipeline(j.at("pipeline"), cfg.pipeline);
    if (j.contains("channels")) {
      cfg.channels.clear();
      for (const auto& kv : j.at("channels").items()) cfg.channels[kv.key()] = kv.value().get<std::string>();
    }
    if (j.contains("store")) {
      take(j.at("store"), "path",            cfg.store.path);
      take(j.at("store"), "busy_timeout_ms", cfg.store.busy_timeout_ms);
    }
    if (j.contains("live")) {
      take(j.at("live"), "subscriber_capacity", cfg.live.subscriber_capacity);
    }
    if (j.contains("log_level")) {
      const auto lvl = parse_log_level(j.at("log_level").get<std::string>());
      if (!lvl) {
        err = "bad log_level: " + j.at("log_level").get<std::string>();
        return false;
      }
      cfg.log_level = *lvl;
    }
    take(j, "health_interval_s", cfg.health_interval_s);
  }
  catch (const json::exception& e) {
    err = std::string("config: ") + e.what();
    return false;
  }
  catch (const std::invalid_argument& e) {
    err = std::string("config: ") + e.what();
    return false;
  }

  if (cfg.mqtt.reconnect_min_ms == 0 || cfg.mqtt.reconnect_max_ms < cfg.mqtt.reconnect_min_ms) {
    err = "config: need 0 < reconnect_min_ms <= reconnect_max_ms";
    return false;
  }
  if (cfg.pipeline.raw_queue_capacity == 0 || cfg.live.subscriber_capacity == 0) {
    err = "config: queue capacities must be positive";
    return false;
  }
  return true;
}

bool load_config_file(const std::string& path, Config& cfg, std::string& err) {
  std::ifstream ifs(path);
  if (!ifs) {
    err = "cannot read config file " + path;
    return false;
  }
  std::stringstream ss;
  ss << ifs.rdbuf();
  return parse_config(ss.str(), cfg, err);
}

bool build_channel_keys(const Config& cfg, ChannelKeys& keys, std::string& err) {
  for (const auto& kv : cfg.channels) {
    std::string why;
    if (!keys.add_base64(kv.first, kv.second, why)) {
      err = "channel " + kv.first + ": " + why;
      return false;
    }
  }
  return true;
}

} // namespace meshview
