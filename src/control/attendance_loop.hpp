#pragma once
#include "../core/clock.hpp"
#include "../core/errors.hpp"
#include "../core/scan_log.hpp"
#include "../core/session_tracker.hpp"
#include "../core/threshold.hpp"
#include "../control/config.hpp"
#include "../control/limits.hpp"
#include "../hw/discovery_source.hpp"
#include "../registry/identity_registry.hpp"
#include "../report/report_emitter.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

/**
 * @brief Attendance scan loop
 *
 * Owns the current session and drives it:
 * - one scan per cycle while a session runs, first cycle right after start
 * - JSON command handling between cycles (start, stop, register, ...)
 * - JSON telemetry for every cycle and session transition
 * - CSV report when a session stops
 *
 * Every touch of the session goes through mutex_. The scan itself runs
 * outside the lock; its result is recorded only if the session that was
 * running when the scan began is still running (generation check), so a
 * stop() that lands mid-scan is final and the late result is dropped.
 *
 * The discovery source is only used from the thread calling run() (or the
 * test thread), never concurrently.
 */
struct AttendanceLoop {
  IdentityRegistry& registry;   ///< Known devices
  IDiscoverySource& source;     ///< Scan capability (real or simulated)
  ReportEmitter& emitter;       ///< CSV writer for finished sessions
  ScanLog log;                  ///< Recent log lines, mirrored to stdout
  Limits lim;                   ///< Bounds for runtime interval changes
  std::atomic<bool> running{true};            ///< run() keeps going while set
  std::atomic<std::uint64_t> scans_discarded{0}; ///< Late results dropped

private:
  mutable std::mutex mutex_;
  std::unique_ptr<SessionTracker> session_;
  std::uint64_t generation_{0};
  std::vector<Classification> last_results_;
  ThresholdRatio threshold_;
  std::chrono::milliseconds interval_;
  std::atomic<bool> reschedule_{false};

  std::mutex pub_mutex_;
  std::function<void(const std::string&)> publisher_;

  void publish(const json& j) {
    std::lock_guard<std::mutex> lock(pub_mutex_);
    if (publisher_) publisher_(j.dump());
  }

  static json names(const std::vector<Identity>& ids) {
    json arr = json::array();
    for (const auto& id : ids) arr.push_back(id.display_name);
    return arr;
  }

public:
  /**
   * @param reg Identity registry (snapshot taken at each session start)
   * @param src Discovery source, already initialized
   * @param em Report writer
   * @param cfg Default threshold, interval and log history size
   * @param log_mirror Stream log lines are echoed to (nullptr = silent)
   */
  AttendanceLoop(IdentityRegistry& reg, IDiscoverySource& src, ReportEmitter& em,
                 const AppConfig& cfg = AppConfig{}, std::ostream* log_mirror = &std::cout)
    : registry(reg), source(src), emitter(em), log(cfg.log_history, log_mirror),
      threshold_(cfg.threshold_ratio()), interval_(cfg.scan_interval()) {}

  /**
   * @brief Where telemetry JSON goes (nullptr disables publishing)
   */
  void set_publisher(std::function<void(const std::string&)> pub) {
    std::lock_guard<std::mutex> lock(pub_mutex_);
    publisher_ = std::move(pub);
  }

  /**
   * @brief Start a new session over the current registry
   * @param threshold Override of the configured threshold
   * @param interval Override of the configured scan interval
   * @return Session number (1-based, increments per successful start)
   * @throws InvalidState if a session is already running
   * @throws InvalidConfiguration on empty registry or bad threshold;
   *         no session is created in that case
   */
  std::uint64_t start_session(std::optional<ThresholdRatio> threshold = std::nullopt,
                              std::optional<std::chrono::milliseconds> interval = std::nullopt) {
    json event;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (session_ && session_->is_running()) {
        throw InvalidState("an attendance session is already running");
      }
      auto tracker = std::make_unique<SessionTracker>();
      tracker->set_log_callback([this](const std::string& line) { log.append(line); });
      const ThresholdRatio t = threshold.value_or(threshold_);
      const auto iv = interval.value_or(interval_);
      if (registry.empty()) {
        log.append("No students are registered. Please run registration first.");
      }
      tracker->start(registry.snapshot(), t, iv);

      threshold_ = t;
      interval_ = iv;
      session_ = std::move(tracker);
      ++generation_;
      reschedule_.store(true);

      event = {{"event", "session_started"},
               {"session", generation_},
               {"date", session_->date()},
               {"registered", session_->identities().size()},
               {"threshold", t.to_string()},
               {"interval_ms", iv.count()},
               {"source", source.get_type_name()}};
    }
    publish(event);
    return event["session"].get<std::uint64_t>();
  }

  /**
   * @brief Stop the running session, classify, write the report
   * @return Classifications in registration order
   * @throws InvalidState if no session is running
   */
  std::vector<Classification> stop_session() {
    std::vector<Classification> results;
    std::uint64_t generation = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!session_ || !session_->is_running()) {
        throw InvalidState("no attendance session is currently running");
      }
      log.append("Stopping attendance session. Finalizing results...");
      results = session_->stop();
      last_results_ = results;
      generation = generation_;
    }

    log.append("--- Final Attendance Report ---");
    for (const auto& line : ReportEmitter::format_table(results)) {
      log.append(line);
    }
    std::string message;
    auto path = emitter.emit(results, message);
    log.append(message);

    publish({{"event", "session_stopped"},
             {"session", generation},
             {"total_scans", results.empty() ? 0 : results.front().total_scans},
             {"report", path.string()},
             {"results", ReportEmitter::to_json(results)}});
    return results;
  }

  bool session_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ && session_->is_running();
  }

  std::uint64_t session_number() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
  }

  std::vector<Classification> last_results() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_results_;
  }

  std::chrono::milliseconds scan_interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interval_;
  }

  /**
   * @brief Run one scan cycle if a session is running
   * @return true if the scan was recorded; false if idle or the session
   *         ended while the scan was in flight
   */
  bool scan_cycle() {
    std::uint64_t generation = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!session_ || !session_->is_running()) return false;
      generation = generation_;
    }

    auto found = source.scan_normalized();
    if (source.get_last_error() != IDiscoverySource::ErrorState::OK) {
      log.append("Scan failed (" + IDiscoverySource::error_to_string(source.get_last_error()) + ": " +
                 source.get_statistics().last_error_message + "), counted as an empty scan");
    }

    json event;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!session_ || generation_ != generation || !session_->is_running()) {
        scans_discarded.fetch_add(1);
        return false;
      }
      auto out = session_->record_scan(found);
      event = {{"event", "scan"},
               {"session", generation},
               {"scan", out.scan_number},
               {"seen", names(out.seen)},
               {"missed", names(out.missed)},
               {"unknown_devices", out.unknown_devices}};
    }
    publish(event);
    return true;
  }

  /**
   * @brief Main loop: scan on schedule, answer commands in between
   * @param pub Telemetry publisher (anything with send(std::string))
   * @param rep Command responder (poll(ms) / recv() / reply(std::string))
   */
  template<class Pub, class Rep>
  void run(Pub& pub, Rep& rep) {
    set_publisher([&pub](const std::string& s) { pub.send(s); });
    ScanClock clk(scan_interval());

    while (running.load(std::memory_order_relaxed)) {
      if (reschedule_.exchange(false)) {
        clk.reset(scan_interval());
      }

      if (session_running() && clk.due()) {
        scan_cycle();
        clk.advance();
      }

      auto wait = std::chrono::milliseconds(100);
      if (session_running()) {
        wait = std::min(wait, std::chrono::duration_cast<std::chrono::milliseconds>(clk.time_to_next()));
      }
      if (rep.poll(static_cast<long>(wait.count()))) {
        std::string cmd = rep.recv();
        rep.reply(handle_cmd(cmd));
      }
    }
    set_publisher(nullptr);
  }

  void stop() { running.store(false); }

  /**
   * @brief Handle one JSON command
   * @param s Command text, e.g. {"cmd":"start","threshold":0.8}
   * @return JSON reply, always with an "ok" field
   */
  std::string handle_cmd(const std::string& s) {
    auto j = json::parse(s, nullptr, false);
    if (!j.is_object() || !j.contains("cmd") || !j["cmd"].is_string()) {
      return R"({"ok":false,"error":"malformed command"})";
    }
    const std::string cmd = j["cmd"].get<std::string>();

    try {
      if (cmd == "start") {
        std::optional<ThresholdRatio> t;
        std::optional<std::chrono::milliseconds> iv;
        if (j.contains("threshold")) t = ThresholdRatio::from_double(j["threshold"].get<double>());
        if (j.contains("interval_s")) iv = lim.clamp_interval(j["interval_s"].get<double>());
        auto n = start_session(t, iv);
        return json{{"ok", true}, {"session", n}}.dump();
      } else if (cmd == "stop") {
        auto results = stop_session();
        return json{{"ok", true}, {"results", ReportEmitter::to_json(results)}}.dump();
      } else if (cmd == "get_status") {
        return status_json().dump();
      } else if (cmd == "discover") {
        if (session_running()) {
          throw InvalidState("cannot scan for registration while a session is running");
        }
        log.append("Starting registration scan...");
        std::map<std::string, std::string> found;
        std::string scan_error;
        try {
          found = source.scan_named();
        } catch (const std::exception& e) {
          // A failed registration scan reports no devices, like an empty inquiry
          scan_error = e.what();
          log.append("Error during Bluetooth scan: " + scan_error);
        }
        json devices = json::array();
        for (const auto& [addr, name] : found) {
          auto owner = registry.find(addr);
          devices.push_back({{"id", addr},
                             {"name", name},
                             {"registered", owner.has_value()},
                             {"owner", owner ? owner->display_name : ""}});
        }
        if (devices.empty()) {
          log.append("No Bluetooth devices found.");
        }
        json reply = {{"ok", true}, {"devices", devices}};
        if (!scan_error.empty()) reply["scan_error"] = scan_error;
        return reply.dump();
      } else if (cmd == "register") {
        if (session_running()) {
          throw InvalidState("cannot register while a session is running");
        }
        auto id = registry.register_device(j.value("id", std::string()), j.value("name", std::string()));
        log.append("Registered " + id.display_name + " with MAC Address " + id.identifier);
        std::string message;
        bool saved = registry.save(message);
        log.append(message);
        return json{{"ok", true}, {"saved", saved}, {"id", id.identifier}, {"name", id.display_name}}.dump();
      } else if (cmd == "list_registry") {
        json arr = json::array();
        for (const auto& id : registry.snapshot()) {
          arr.push_back({{"id", id.identifier}, {"name", id.display_name}});
        }
        return json{{"ok", true}, {"registry", arr}}.dump();
      } else if (cmd == "get_log") {
        std::size_t lines = j.value("lines", std::size_t{50});
        return json{{"ok", true}, {"lines", log.snapshot(lines)}}.dump();
      } else if (cmd == "set_interval") {
        auto iv = lim.clamp_interval(j.value("interval_s", 5.0));
        {
          std::lock_guard<std::mutex> lock(mutex_);
          interval_ = iv;
        }
        reschedule_.store(true);
        return json{{"ok", true}, {"interval_ms", iv.count()}}.dump();
      }
    } catch (const std::exception& e) {
      return json{{"ok", false}, {"error", e.what()}}.dump();
    }
    return json{{"ok", false}, {"error", "unknown command " + cmd}}.dump();
  }

  /**
   * @brief Snapshot of the loop and current session for get_status
   */
  json status_json() const {
    const auto& st = source.get_statistics();
    json status = {
      {"ok", true},
      {"session", 0},
      {"status", "Idle"},
      {"registered", registry.size()},
      {"scans_discarded", scans_discarded.load()},
      {"source", {{"type", source.get_type_name()},
                  {"id", source.get_id()},
                  {"healthy", source.is_healthy()},
                  {"total_scans", st.total_scans},
                  {"failed_scans", st.failed_scans}}}
    };

    std::lock_guard<std::mutex> lock(mutex_);
    status["threshold"] = threshold_.to_string();
    status["interval_ms"] = interval_.count();
    if (session_) {
      status["session"] = generation_;
      status["status"] = SessionTracker::status_name(session_->status());
      status["date"] = session_->date();
      status["total_scans"] = session_->total_scans();
      json counts = json::array();
      for (const auto& id : session_->identities()) {
        counts.push_back({{"id", id.identifier},
                          {"name", id.display_name},
                          {"detections", session_->detection_count(id.identifier)}});
      }
      status["counts"] = counts;
      if (!session_->is_running()) {
        status["results"] = ReportEmitter::to_json(last_results_);
      }
    }
    return status;
  }
};
