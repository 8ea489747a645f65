#pragma once
/**
 * @file mosquitto_client.hpp
 * @brief IBrokerClient on libmosquitto (Linux host; blocking loop driven by poll()).
 *
 * Depends on: libmosquitto (mosquitto.h). The Listener owns the thread; this
 * class never starts one of its own (no mosquitto_loop_start).
 *
 * Lifecycle per connection attempt:
 *   connect()  -> mosquitto_connect() + wait for CONNACK
 *   subscribe()-> mosquitto_subscribe(qos 0)
 *   poll()     -> mosquitto_loop(); callbacks hand deliveries to the handler
 *   disconnect()
 */

#include "meshview/transport/broker_client.hpp"

#include <mosquitto.h>

#include <string>
#include <utility>

namespace meshview::transport {

class MosquittoClient : public IBrokerClient {
public:
  MosquittoClient();
  ~MosquittoClient() override;

  MosquittoClient(const MosquittoClient&) = delete;
  MosquittoClient& operator=(const MosquittoClient&) = delete;

  void       set_message_handler(MessageHandler handler) override { handler_ = std::move(handler); }
  ConnResult connect(const BrokerConfig& cfg, std::string& err) override;
  bool       subscribe(const std::string& filter, std::string& err) override;
  PollResult poll(int timeout_ms, std::string& err) override;
  void       disconnect() override;
  const char* name() const override { return "mosquitto"; }

private:
  static void on_connect(struct mosquitto*, void* self, int rc);
  static void on_disconnect(struct mosquitto*, void* self, int rc);
  static void on_message(struct mosquitto*, void* self, const struct mosquitto_message* msg);

  void destroy();

  struct mosquitto* mosq_{nullptr};
  MessageHandler handler_;
  int  connack_rc_{-1};        // -1 until CONNACK arrives
  bool connected_{false};
};

} // namespace meshview::transport
