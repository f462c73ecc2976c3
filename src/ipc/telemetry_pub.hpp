#pragma once
#include <zmq.h>
#include <string>

/**
 * @brief ZeroMQ attendance telemetry publisher
 *
 * Publishes JSON messages on the "attendance" topic as a two-frame message
 * (topic, payload). Events:
 * {"event":"session_started","session":1,"registered":3,"threshold":"4/5",...}
 * {"event":"scan","session":1,"scan":4,"seen":["Alice"],"missed":["Bob"],...}
 * {"event":"session_stopped","session":1,"total_scans":10,"results":[...]}
 */
struct TelemetryPub {
  static constexpr const char* kTopic = "attendance";

  void* ctx{nullptr};  ///< ZeroMQ context
  void* pub{nullptr};  ///< ZeroMQ PUB socket
  std::string endpoint;
  bool bound{false};

  /**
   * @brief Create and bind the publisher socket
   * @param ep Bind address, e.g. "tcp://127.0.0.1:5556"
   */
  explicit TelemetryPub(std::string ep = "tcp://127.0.0.1:5556") : endpoint(std::move(ep)) {
    ctx = zmq_ctx_new();
    pub = zmq_socket(ctx, ZMQ_PUB);
    int linger = 0;
    zmq_setsockopt(pub, ZMQ_LINGER, &linger, sizeof(linger));
    bound = zmq_bind(pub, endpoint.c_str()) == 0;
  }

  ~TelemetryPub() {
    zmq_close(pub);
    zmq_ctx_term(ctx);
  }

  TelemetryPub(const TelemetryPub&) = delete;
  TelemetryPub& operator=(const TelemetryPub&) = delete;

  bool is_connected() const { return bound; }
  const std::string& get_bind_address() const { return endpoint; }

  /**
   * @brief Publish one JSON message (dropped silently with no subscribers)
   */
  void send(const std::string& s) {
    zmq_send(pub, kTopic, std::char_traits<char>::length(kTopic), ZMQ_SNDMORE);
    zmq_send(pub, s.data(), s.size(), 0);
  }
};
