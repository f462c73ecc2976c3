#include <zmq.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

/**
 * @brief Command-line client for the attendance scanner control endpoint
 *
 * Usage: attendance_ctl [-e endpoint] <cmd> [key=value ...]
 *   attendance_ctl start threshold=0.8 interval_s=5
 *   attendance_ctl register id=AA:BB:CC:DD:EE:01 name=Alice
 *   attendance_ctl stop
 * Values that parse as JSON (numbers, true/false) are sent as such,
 * everything else as a string.
 */
int main(int argc, char** argv) {
    std::string endpoint = "tcp://127.0.0.1:5555";
    int i = 1;
    if (i + 1 < argc && std::string(argv[i]) == "-e") {
        endpoint = argv[i + 1];
        i += 2;
    }
    if (i >= argc) {
        std::cerr << "usage: " << argv[0] << " [-e endpoint] <cmd> [key=value ...]" << std::endl;
        return 2;
    }

    json cmd = {{"cmd", argv[i++]}};
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        auto eq = arg.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cerr << "ignoring argument without key=value form: " << arg << std::endl;
            continue;
        }
        std::string key = arg.substr(0, eq);
        std::string value = arg.substr(eq + 1);
        auto parsed = json::parse(value, nullptr, false);
        if (!parsed.is_discarded() && (parsed.is_number() || parsed.is_boolean())) {
            cmd[key] = parsed;
        } else {
            cmd[key] = value;
        }
    }

    void* ctx = zmq_ctx_new();
    void* req = zmq_socket(ctx, ZMQ_REQ);
    int timeout_ms = 30000;
    int linger = 0;
    zmq_setsockopt(req, ZMQ_RCVTIMEO, &timeout_ms, sizeof(timeout_ms));
    zmq_setsockopt(req, ZMQ_LINGER, &linger, sizeof(linger));

    int rc = 1;
    if (zmq_connect(req, endpoint.c_str()) != 0) {
        std::cerr << "cannot connect to " << endpoint << ": " << zmq_strerror(zmq_errno()) << std::endl;
    } else {
        const std::string text = cmd.dump();
        zmq_send(req, text.data(), text.size(), 0);

        zmq_msg_t msg;
        zmq_msg_init(&msg);
        int n = zmq_msg_recv(&msg, req, 0);
        if (n < 0) {
            std::cerr << "no reply from " << endpoint << ": " << zmq_strerror(zmq_errno()) << std::endl;
        } else {
            std::string reply(static_cast<const char*>(zmq_msg_data(&msg)), static_cast<std::size_t>(n));
            auto j = json::parse(reply, nullptr, false);
            std::cout << (j.is_discarded() ? reply : j.dump(2)) << std::endl;
            rc = (!j.is_discarded() && j.value("ok", false)) ? 0 : 1;
        }
        zmq_msg_close(&msg);
    }

    zmq_close(req);
    zmq_ctx_term(ctx);
    return rc;
}
