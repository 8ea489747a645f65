#pragma once
/**
 * @file broker_client.hpp
 * @brief Minimal pub/sub broker client interface the Listener drives.
 *
 * Implemented by transport::MosquittoClient on hosts and by an in-process
 * fake in tests/test_listener.cpp.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace meshview::transport {

// Return codes kept simple; detail goes into the err string.
enum class ConnResult : uint8_t { Ok = 0, Refused = 1, Error = 2 };
enum class PollResult : uint8_t { Ok = 0, Lost = 1 };

/// Observable connection state for health reporting.
enum class ConnState : uint8_t { Idle = 0, Connecting = 1, Connected = 2, Backoff = 3, Stopped = 4 };

const char* conn_state_name(ConnState st);

struct BrokerConfig {
  std::string host{"localhost"};
  uint16_t    port{1883};
  std::string username;
  std::string password;
  std::string client_id;
  uint16_t    keepalive_s{60};
};

/**
 * @brief Broker client trait.
 *
 * Contract:
 *  - connect() performs one blocking connection attempt.
 *  - subscribe() registers one topic filter on the current connection.
 *  - poll(timeout) services network I/O for up to timeout_ms and invokes the
 *    message handler for each delivery, on the calling thread. It returns
 *    Lost once the connection is gone; the caller reconnects.
 *  - disconnect() is safe to call in any state.
 *  - The handler must not block; it only hands the bytes off.
 */
class IBrokerClient {
public:
  using MessageHandler = std::function<void(const std::string& topic, const uint8_t* data, std::size_t len)>;

  virtual ~IBrokerClient() = default;
  virtual void       set_message_handler(MessageHandler handler) = 0;
  virtual ConnResult connect(const BrokerConfig& cfg, std::string& err) = 0;
  virtual bool       subscribe(const std::string& filter, std::string& err) = 0;
  virtual PollResult poll(int timeout_ms, std::string& err) = 0;
  virtual void       disconnect() = 0;
  virtual const char* name() const = 0;
};

} // namespace meshview::transport
