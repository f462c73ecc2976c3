#pragma once
#include "../core/errors.hpp"
#include "../core/threshold.hpp"
#include "limits.hpp"
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Discovery source selection and simulator knobs
 */
struct DiscoveryConfig {
  std::string source{"simulated"};        ///< "simulated" or "bluetooth"
  double detection_probability{0.75};     ///< Simulator: chance a device answers
  std::uint64_t seed{0};                  ///< Simulator: 0 = random
  bool simulate_latency{true};            ///< Simulator: sleep half the scan duration
  std::vector<std::string> strangers;     ///< Simulator: unregistered nearby devices
  int hci_device{-1};                     ///< Bluetooth: adapter id, -1 = default
};

/**
 * @brief ZeroMQ endpoints
 */
struct IpcConfig {
  std::string telemetry{"tcp://127.0.0.1:5556"};  ///< PUB bind address
  std::string control{"tcp://127.0.0.1:5555"};    ///< REP bind address
};

/**
 * @brief Service configuration
 *
 * Loaded from a JSON file; every key is optional. Example:
 * {"threshold": 0.8, "scan_interval_s": 5, "scan_duration_s": 5,
 *  "registry_file": "registered_students.json", "report_dir": ".",
 *  "autostart": false,
 *  "discovery": {"source": "simulated", "detection_probability": 0.75},
 *  "ipc": {"telemetry": "tcp://127.0.0.1:5556", "control": "tcp://127.0.0.1:5555"}}
 */
struct AppConfig {
  double threshold{0.8};
  double scan_interval_s{5.0};
  double scan_duration_s{5.0};
  std::string registry_file{"registered_students.json"};
  std::string report_dir{"."};
  bool autostart{false};
  std::size_t log_history{256};
  DiscoveryConfig discovery;
  IpcConfig ipc;

  ThresholdRatio threshold_ratio() const {
    return ThresholdRatio::from_double(threshold);
  }

  std::chrono::milliseconds scan_interval() const {
    return Limits{}.clamp_interval(scan_interval_s);
  }

  std::chrono::milliseconds scan_duration() const {
    return Limits{}.clamp_duration(scan_duration_s);
  }

  /**
   * @brief Range checks
   * @throws InvalidConfiguration naming the first offending key
   */
  void validate() const {
    threshold_ratio();
    const Limits lim{};
    if (!lim.interval_ok(scan_interval_s)) {
      throw InvalidConfiguration("scan_interval_s must be in [" + std::to_string(lim.interval_min_s) +
                                 ", " + std::to_string(lim.interval_max_s) + "]");
    }
    if (!lim.duration_ok(scan_duration_s)) {
      throw InvalidConfiguration("scan_duration_s must be in (0, " + std::to_string(lim.duration_max_s) + "]");
    }
    if (registry_file.empty()) {
      throw InvalidConfiguration("registry_file must not be empty");
    }
    if (discovery.source != "simulated" && discovery.source != "bluetooth") {
      throw InvalidConfiguration("discovery.source must be \"simulated\" or \"bluetooth\", got \"" +
                                 discovery.source + "\"");
    }
    if (discovery.detection_probability < 0.0 || discovery.detection_probability > 1.0) {
      throw InvalidConfiguration("discovery.detection_probability must be in [0,1]");
    }
    if (log_history == 0) {
      throw InvalidConfiguration("log_history must be > 0");
    }
  }

  /**
   * @brief Build from parsed JSON, missing keys keep their defaults
   * @throws InvalidConfiguration on wrong types or out-of-range values
   */
  static AppConfig from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
      throw InvalidConfiguration("configuration root must be a JSON object");
    }
    AppConfig c;
    try {
      c.threshold = j.value("threshold", c.threshold);
      c.scan_interval_s = j.value("scan_interval_s", c.scan_interval_s);
      c.scan_duration_s = j.value("scan_duration_s", c.scan_duration_s);
      c.registry_file = j.value("registry_file", c.registry_file);
      c.report_dir = j.value("report_dir", c.report_dir);
      c.autostart = j.value("autostart", c.autostart);
      c.log_history = j.value("log_history", c.log_history);

      if (j.contains("discovery")) {
        const auto& d = j.at("discovery");
        c.discovery.source = d.value("source", c.discovery.source);
        c.discovery.detection_probability = d.value("detection_probability", c.discovery.detection_probability);
        c.discovery.seed = d.value("seed", c.discovery.seed);
        c.discovery.simulate_latency = d.value("simulate_latency", c.discovery.simulate_latency);
        c.discovery.strangers = d.value("strangers", c.discovery.strangers);
        c.discovery.hci_device = d.value("hci_device", c.discovery.hci_device);
      }
      if (j.contains("ipc")) {
        const auto& i = j.at("ipc");
        c.ipc.telemetry = i.value("telemetry", c.ipc.telemetry);
        c.ipc.control = i.value("control", c.ipc.control);
      }
    } catch (const nlohmann::json::exception& e) {
      throw InvalidConfiguration(e.what());
    }
    c.validate();
    return c;
  }

  /**
   * @brief Parse a JSON configuration document
   */
  static AppConfig parse(const std::string& text) {
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
      throw InvalidConfiguration("configuration is not valid JSON");
    }
    return from_json(j);
  }

  /**
   * @brief Load a configuration file
   * @throws InvalidConfiguration if unreadable or invalid
   */
  static AppConfig load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
      throw InvalidConfiguration("cannot open configuration file " + path);
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse(text);
  }
};
