#pragma once
#include <zmq.h>
#include <string>

/**
 * @brief ZeroMQ control command responder
 *
 * Receives JSON commands and sends one JSON reply per command (REQ/REP).
 *
 * Supported commands (see AttendanceLoop::handle_cmd):
 * - {"cmd":"start","threshold":0.8,"interval_s":5}
 * - {"cmd":"stop"}
 * - {"cmd":"get_status"}
 * - {"cmd":"discover"}
 * - {"cmd":"register","id":"AA:BB:CC:DD:EE:01","name":"Alice"}
 * - {"cmd":"list_registry"}
 * - {"cmd":"get_log","lines":50}
 * - {"cmd":"set_interval","interval_s":2}
 */
struct ControlRep {
  void* ctx{nullptr};  ///< ZeroMQ context
  void* rep{nullptr};  ///< ZeroMQ REP socket
  std::string endpoint;
  bool bound{false};

  /**
   * @brief Create and bind the responder socket
   * @param ep Bind address, e.g. "tcp://127.0.0.1:5555"
   */
  explicit ControlRep(std::string ep = "tcp://127.0.0.1:5555") : endpoint(std::move(ep)) {
    ctx = zmq_ctx_new();
    rep = zmq_socket(ctx, ZMQ_REP);
    int linger = 0;
    zmq_setsockopt(rep, ZMQ_LINGER, &linger, sizeof(linger));
    bound = zmq_bind(rep, endpoint.c_str()) == 0;
  }

  ~ControlRep() {
    zmq_close(rep);
    zmq_ctx_term(ctx);
  }

  ControlRep(const ControlRep&) = delete;
  ControlRep& operator=(const ControlRep&) = delete;

  bool is_connected() const { return bound; }
  const std::string& get_bind_address() const { return endpoint; }

  /**
   * @brief Wait up to timeout_ms for a command
   * @return true if recv() will not block
   */
  bool poll(long timeout_ms) {
    zmq_pollitem_t items[] = {{rep, 0, ZMQ_POLLIN, 0}};
    if (zmq_poll(items, 1, timeout_ms) <= 0) {
      return false;
    }
    return (items[0].revents & ZMQ_POLLIN) != 0;
  }

  /**
   * @brief Receive one command (blocking). Caller must reply.
   */
  std::string recv() {
    zmq_msg_t msg;
    zmq_msg_init(&msg);
    int n = zmq_msg_recv(&msg, rep, 0);
    std::string out;
    if (n > 0) {
      out.assign(static_cast<const char*>(zmq_msg_data(&msg)), static_cast<std::size_t>(n));
    }
    zmq_msg_close(&msg);
    return out;
  }

  void reply(const std::string& s) {
    zmq_send(rep, s.data(), s.size(), 0);
  }
};
