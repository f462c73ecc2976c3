#include "../src/ipc/telemetry_pub.hpp"
#include <cassert>
#include <chrono>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include <zmq.h>

/**
 * @brief Test TelemetryPub functionality
 *
 * Tests publisher creation, cleanup, and delivery of attendance events
 * to a subscriber on the "attendance" topic.
 */
int main() {
  std::cout << "Testing TelemetryPub functionality..." << std::endl;

  const std::string endpoint = "tcp://127.0.0.1:15556";

  try {
    // Test 1: Send without subscribers
    {
      std::cout << "Test 1: Send without subscribers" << std::endl;
      TelemetryPub pub(endpoint);
      assert(pub.is_connected());
      assert(pub.get_bind_address() == endpoint);

      pub.send(R"({"event":"session_started","session":1,"registered":2,"threshold":"4/5"})");
      pub.send(R"({"event":"scan","session":1,"scan":1,"seen":["Alice"],"missed":["Bob"]})");
      std::cout << "  Messages dropped without error" << std::endl;
    }

    // Test 2: Repeated create/cleanup on the same port
    {
      std::cout << "Test 2: Repeated create/cleanup" << std::endl;
      for (int i = 0; i < 3; i++) {
        TelemetryPub pub(endpoint);
        assert(pub.is_connected());
        pub.send(R"({"event":"scan","session":1,"scan":)" + std::to_string(i + 1) + "}");
      }
      std::cout << "  Multiple publisher creation/cleanup test passed" << std::endl;
    }

    // Test 3: Subscriber receives topic and payload
    {
      std::cout << "Test 3: Subscriber delivery" << std::endl;
      TelemetryPub pub(endpoint);

      void* ctx = zmq_ctx_new();
      void* sub = zmq_socket(ctx, ZMQ_SUB);
      zmq_setsockopt(sub, ZMQ_SUBSCRIBE, TelemetryPub::kTopic, std::strlen(TelemetryPub::kTopic));
      int timeout = 100;
      zmq_setsockopt(sub, ZMQ_RCVTIMEO, &timeout, sizeof(timeout));
      int rc = zmq_connect(sub, endpoint.c_str());
      assert(rc == 0);

      // PUB drops messages until the subscription arrives; retry
      const std::string payload = R"({"event":"session_stopped","session":1,"total_scans":10})";
      std::string topic, body;
      for (int attempt = 0; attempt < 50 && body.empty(); ++attempt) {
        pub.send(payload);
        char buf[1024];
        int n = zmq_recv(sub, buf, sizeof(buf), 0);
        if (n <= 0) continue;
        topic.assign(buf, buf + n);
        int more = 0;
        size_t more_size = sizeof(more);
        zmq_getsockopt(sub, ZMQ_RCVMORE, &more, &more_size);
        assert(more == 1);
        n = zmq_recv(sub, buf, sizeof(buf), 0);
        assert(n > 0);
        body.assign(buf, buf + n);
      }

      zmq_close(sub);
      zmq_ctx_term(ctx);

      assert(topic == "attendance");
      assert(body == payload);
      std::cout << "  Subscriber received: " << body << std::endl;
    }

  } catch (const std::exception& e) {
    std::cerr << "Exception: " << e.what() << std::endl;
    return 1;
  }

  std::cout << "\n✅ All TelemetryPub tests passed!" << std::endl;
  return 0;
}
