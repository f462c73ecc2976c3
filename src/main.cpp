#include <iostream>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>
#include <string>

#include "control/attendance_loop.hpp"
#include "control/config.hpp"
#include "hw/discovery_factory.hpp"
#include "ipc/control_rep.hpp"
#include "ipc/telemetry_pub.hpp"
#include "registry/identity_registry.hpp"
#include "report/report_emitter.hpp"

// Global flag for clean shutdown
std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    (void)signal;
    shutdown_requested.store(true);
}

int main(int argc, char** argv) {
    std::cout << "Attendance Scanner - Starting up..." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        AppConfig cfg;
        if (argc > 1) {
            cfg = AppConfig::load(argv[1]);
            std::cout << "Loaded configuration from " << argv[1] << std::endl;
        }

        // Registry
        IdentityRegistry registry(cfg.registry_file);
        std::string message;
        if (registry.load(message)) {
            std::cout << message << std::endl;
        } else {
            // Missing or unreadable file: start with an empty registry
            std::cerr << message << std::endl;
        }

        // Discovery source, chosen once from configuration
        auto source = make_discovery_source(cfg, [&registry]() { return registry.snapshot(); });
        if (!source->initialize()) {
            std::cerr << "Failed to initialize " << source->get_type_name() << " discovery source ("
                      << IDiscoverySource::error_to_string(source->get_last_error()) << ")" << std::endl;
            return 1;
        }
        if (source->get_type_name() == "simulated") {
            std::cout << "*** Running in SIMULATION MODE: no Bluetooth adapter is used. ***" << std::endl;
        }

        ReportEmitter emitter(cfg.report_dir);
        AttendanceLoop loop(registry, *source, emitter, cfg);
        loop.log.append("Attendance threshold is set to " +
                        std::to_string(static_cast<int>(cfg.threshold * 100.0 + 0.5)) +
                        "% of total scans.");

        // IPC
        TelemetryPub telemetry_pub(cfg.ipc.telemetry);
        ControlRep control_rep(cfg.ipc.control);

        if (!telemetry_pub.is_connected()) {
            std::cerr << "Failed to bind telemetry publisher to " << cfg.ipc.telemetry << std::endl;
            return 1;
        }
        if (!control_rep.is_connected()) {
            std::cerr << "Failed to bind control responder to " << cfg.ipc.control << std::endl;
            return 1;
        }

        std::cout << "Telemetry publisher bound to: " << telemetry_pub.get_bind_address() << std::endl;
        std::cout << "Control responder bound to: " << control_rep.get_bind_address() << std::endl;

        if (cfg.autostart) {
            loop.start_session();
        }

        std::cout << "Ready. Send {\"cmd\":\"start\"} / {\"cmd\":\"stop\"} to the control endpoint." << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;

        std::thread loop_thread([&]() {
            try {
                loop.run(telemetry_pub, control_rep);
            } catch (const std::exception& e) {
                std::cerr << "Attendance loop error: " << e.what() << std::endl;
                shutdown_requested.store(true);
            }
        });

        while (!shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        std::cout << "\nShutdown requested, stopping..." << std::endl;
        loop.stop();
        if (loop_thread.joinable()) {
            loop_thread.join();
        }

        // A session still running is finalized so its report is not lost
        if (loop.session_running()) {
            loop.set_publisher([&telemetry_pub](const std::string& s) { telemetry_pub.send(s); });
            loop.stop_session();
        }

        const auto& st = source->get_statistics();
        std::cout << "Discovery statistics:" << std::endl;
        std::cout << "  Total scans: " << st.total_scans << std::endl;
        std::cout << "  Failed scans: " << st.failed_scans << std::endl;
        std::cout << "  Late results discarded: " << loop.scans_discarded.load() << std::endl;
        source->shutdown();

        std::cout << "Shutdown complete." << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
