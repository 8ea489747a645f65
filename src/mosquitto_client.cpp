// ============================================================================
// mosquitto_client.cpp — implementation for mosquitto_client.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "mosquitto_client.hpp"

#include <mutex>

namespace meshview::transport {

static std::once_flag g_lib_once;

MosquittoClient::MosquittoClient() {
  std::call_once(g_lib_once, [] { mosquitto_lib_init(); });   // process-wide; never cleaned up
}

MosquittoClient::~MosquittoClient() {
  disconnect();
  destroy();
}

void MosquittoClient::destroy() {
  if (mosq_) {
    mosquitto_destroy(mosq_);
    mosq_ = nullptr;
  }
}

/*
 * connect()
 * ---------
 * PRE:    any state; a previous session is torn down first.
 * POLICY: clean session, QoS 0 everywhere. CONNACK is awaited by pumping
 *         mosquitto_loop() for at most keepalive seconds.
 * OUT:    Ok | Refused (broker said no) | Error (network / library).
 */
ConnResult MosquittoClient::connect(const BrokerConfig& cfg, std::string& err) {
  disconnect();
  destroy();

  const char* id = cfg.client_id.empty() ? nullptr : cfg.client_id.c_str();
  mosq_ = mosquitto_new(id, /*clean_session*/true, this);
  if (!mosq_) {
    err = "mosquitto_new failed";
    return ConnResult::Error;
  }
  mosquitto_connect_callback_set(mosq_, &MosquittoClient::on_connect);
  mosquitto_disconnect_callback_set(mosq_, &MosquittoClient::on_disconnect);
  mosquitto_message_callback_set(mosq_, &MosquittoClient::on_message);

  if (!cfg.username.empty()) {
    const int rc = mosquitto_username_pw_set(mosq_, cfg.username.c_str(),
                                             cfg.password.empty() ? nullptr : cfg.password.c_str());
    if (rc != MOSQ_ERR_SUCCESS) {
      err = std::string("credentials: ") + mosquitto_strerror(rc);
      return ConnResult::Error;
    }
  }

  connack_rc_ = -1;
  connected_  = false;
  int rc = mosquitto_connect(mosq_, cfg.host.c_str(), cfg.port, cfg.keepalive_s);
  if (rc != MOSQ_ERR_SUCCESS) {
    err = std::string("connect ") + cfg.host + ":" + std::to_string(cfg.port) + ": " + mosquitto_strerror(rc);
    return ConnResult::Error;
  }

  const int max_rounds = static_cast<int>(cfg.keepalive_s ? cfg.keepalive_s : 10) * 10;
  for (int i = 0; i < max_rounds && connack_rc_ < 0; ++i) {
    rc = mosquitto_loop(mosq_, 100, 1);
    if (rc != MOSQ_ERR_SUCCESS) {
      err = std::string("awaiting connack: ") + mosquitto_strerror(rc);
      return ConnResult::Error;
    }
  }
  if (connack_rc_ < 0) {
    err = "no connack from broker";
    return ConnResult::Error;
  }
  if (connack_rc_ != 0) {
    err = std::string("refused: ") + mosquitto_connack_string(connack_rc_);
    return ConnResult::Refused;
  }
  return ConnResult::Ok;
}

bool MosquittoClient::subscribe(const std::string& filter, std::string& err) {
  if (!mosq_ || !connected_) {
    err = "not connected";
    return false;
  }
  const int rc = mosquitto_subscribe(mosq_, nullptr, filter.c_str(), /*qos*/0);
  if (rc != MOSQ_ERR_SUCCESS) {
    err = std::string("subscribe ") + filter + ": " + mosquitto_strerror(rc);
    return false;
  }
  return true;
}

PollResult MosquittoClient::poll(int timeout_ms, std::string& err) {
  if (!mosq_ || !connected_) {
    err = "not connected";
    return PollResult::Lost;
  }
  const int rc = mosquitto_loop(mosq_, timeout_ms, 1);
  if (rc != MOSQ_ERR_SUCCESS) {
    err = mosquitto_strerror(rc);
    connected_ = false;
    return PollResult::Lost;
  }
  if (!connected_) {                               // on_disconnect fired inside the loop
    err = "broker closed the connection";
    return PollResult::Lost;
  }
  return PollResult::Ok;
}

void MosquittoClient::disconnect() {
  if (mosq_ && connected_) mosquitto_disconnect(mosq_);
  connected_ = false;
}

// ---------- callbacks (run on the poll() caller's thread) ----------

void MosquittoClient::on_connect(struct mosquitto*, void* self, int rc) {
  auto* c = static_cast<MosquittoClient*>(self);
  c->connack_rc_ = rc;
  c->connected_  = (rc == 0);
}

void MosquittoClient::on_disconnect(struct mosquitto*, void* self, int) {
  static_cast<MosquittoClient*>(self)->connected_ = false;
}

void MosquittoClient::on_message(struct mosquitto*, void* self, const struct mosquitto_message* msg) {
  auto* c = static_cast<MosquittoClient*>(self);
  if (!c->handler_ || !msg || !msg->topic) return;
  c->handler_(msg->topic, static_cast<const uint8_t*>(msg->payload),
              msg->payloadlen > 0 ? static_cast<std::size_t>(msg->payloadlen) : 0);
}

} // namespace meshview::transport
