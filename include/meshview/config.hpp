/**
 * @file config.hpp
 * @brief Runtime configuration with defaults for every field.
 *
 * @details
 * The daemon fills this from a JSON file (config_file.hpp) and then applies
 * command-line overrides. Every field has a usable default so an empty
 * config connects to a local broker, keeps the store in `meshview.db`, and
 * decodes the default public channel.
 *
 * @code
 * {
 *   "mqtt":     { "host": "mqtt.example.org", "port": 1883, "topics": ["msh/US/#"] },
 *   "pipeline": { "workers": 4, "raw_queue_capacity": 4096, "ignore_from": [2144342101] },
 *   "channels": { "LongFast": "AQ==" },
 *   "store":    { "path": "meshview.db", "busy_timeout_ms": 2000 },
 *   "live":     { "subscriber_capacity": 256 },
 *   "log_level": "info",
 *   "health_interval_s": 60
 * }
 * @endcode
 */

#ifndef MESHVIEW_CONFIG_HPP
#define MESHVIEW_CONFIG_HPP

#include <stdint.h>
#include <stddef.h>
#include <map>
#include <set>
#include <string>

#include "meshview/listener.hpp"
#include "meshview/log.hpp"
#include "meshview/types.hpp"

namespace meshview {

struct PipelineConfig {
  size_t   raw_queue_capacity{4096};
  unsigned workers{2};
  uint32_t store_max_attempts{4};          ///< total tries per store call (>= 1)
  uint32_t store_backoff_ms{50};           ///< first retry delay; doubles per attempt
  uint32_t store_degraded_threshold{8};    ///< consecutive drops before degraded
  std::set<NodeNum> ignore_from;
};

struct StoreConfig {
  std::string path{"meshview.db"};         ///< ":memory:" allowed; "memory" = in-process store
  uint32_t    busy_timeout_ms{2000};
};

struct LiveConfig {
  size_t subscriber_capacity{256};
};

struct Config {
  ListenerConfig mqtt;
  PipelineConfig pipeline;
  std::map<std::string, std::string> channels{{"LongFast", "AQ=="}};   ///< name -> base64 PSK
  StoreConfig    store;
  LiveConfig     live;
  LogLevel       log_level{LogLevel::Info};
  uint32_t       health_interval_s{60};
};

} // namespace meshview

#endif // MESHVIEW_CONFIG_HPP
