#pragma once
#include "classification.hpp"
#include "clock.hpp"
#include "errors.hpp"
#include "identity.hpp"
#include "threshold.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

/**
 * @brief Per-session presence counters and threshold evaluation
 *
 * Lifecycle is NotStarted -> Running -> Stopped, one way only; a new run
 * needs a new tracker. Only identities passed to start() are tracked, in the
 * order given. Evaluation happens exactly once, in stop(), over counters that
 * can no longer change.
 *
 * Not thread-safe: record_scan() and stop() must be serialized by the owner
 * (AttendanceLoop holds a mutex around every call).
 */
class SessionTracker {
public:
  enum class Status { NotStarted, Running, Stopped };

  /**
   * @brief What a single record_scan() call observed
   */
  struct ScanOutcome {
    std::uint64_t scan_number{0};   ///< 1-based index of this cycle
    std::vector<Identity> seen;     ///< Tracked identities detected this cycle
    std::vector<Identity> missed;   ///< Tracked identities not detected
    std::size_t unknown_devices{0}; ///< Distinct identifiers not tracked
  };

  using LogCallback = std::function<void(const std::string&)>;

private:
  Status status_{Status::NotStarted};
  std::vector<Identity> identities_;
  std::vector<std::uint64_t> counts_;
  std::unordered_map<std::string, std::size_t> index_;
  std::uint64_t total_scans_{0};
  ThresholdRatio threshold_;
  std::chrono::milliseconds scan_interval_{0};
  std::string date_;
  std::chrono::system_clock::time_point started_at_;
  std::vector<Classification> results_;
  LogCallback log_;

  void emit(const std::string& line) const {
    if (log_) log_(line);
  }

public:
  SessionTracker() = default;

  void set_log_callback(LogCallback cb) { log_ = std::move(cb); }

  /**
   * @brief Begin counting for the given identities
   * @param registry Identities to track, in registration order
   * @param threshold Fraction of scans needed to be present
   * @param scan_interval Period between scan cycles (informational)
   * @throws InvalidState if already Running or Stopped
   * @throws InvalidConfiguration on empty registry, duplicate identifiers
   *         or negative interval
   */
  void start(const std::vector<Identity>& registry, ThresholdRatio threshold,
             std::chrono::milliseconds scan_interval) {
    if (status_ != Status::NotStarted) {
      throw InvalidState(std::string("start() while ") + status_name(status_));
    }
    if (registry.empty()) {
      throw InvalidConfiguration("registry is empty, register devices first");
    }
    if (threshold.den == 0 || threshold.num == 0 || threshold.num > threshold.den) {
      throw InvalidConfiguration("threshold ratio must be in (0,1], got " + threshold.to_string());
    }
    if (scan_interval.count() < 0) {
      throw InvalidConfiguration("scan interval must not be negative");
    }

    std::unordered_map<std::string, std::size_t> index;
    for (std::size_t i = 0; i < registry.size(); ++i) {
      if (!index.emplace(registry[i].identifier, i).second) {
        throw InvalidConfiguration("duplicate identifier " + registry[i].identifier);
      }
    }

    identities_ = registry;
    counts_.assign(registry.size(), 0);
    index_ = std::move(index);
    total_scans_ = 0;
    threshold_ = threshold;
    scan_interval_ = scan_interval;
    started_at_ = std::chrono::system_clock::now();
    date_ = iso_date(started_at_);
    status_ = Status::Running;

    emit("Starting attendance session: " + std::to_string(identities_.size()) +
         " registered, threshold " + threshold_.to_string() + ", interval " +
         std::to_string(scan_interval_.count()) + " ms");
  }

  /**
   * @brief Count one completed scan cycle
   *
   * Identifiers are deduplicated first, so each tracked identity gains at
   * most one detection per call. Identifiers that are not tracked are
   * ignored. total_scans grows by one even when nothing was discovered.
   *
   * @param discovered Raw identifiers from the discovery source (any range
   *        of strings, duplicates allowed)
   * @throws InvalidState unless Running
   */
  template<class Range>
  ScanOutcome record_scan(const Range& discovered) {
    if (status_ != Status::Running) {
      throw InvalidState(std::string("record_scan() while ") + status_name(status_));
    }

    std::unordered_set<std::string> unique;
    for (const auto& id : discovered) {
      unique.emplace(id);
    }

    ScanOutcome out;
    out.scan_number = total_scans_ + 1;
    for (std::size_t i = 0; i < identities_.size(); ++i) {
      if (unique.count(identities_[i].identifier)) {
        ++counts_[i];
        out.seen.push_back(identities_[i]);
      } else {
        out.missed.push_back(identities_[i]);
      }
    }
    out.unknown_devices = unique.size() - out.seen.size();
    total_scans_ = out.scan_number;

    emit(format_scan_line(out));
    return out;
  }

  /**
   * @brief Freeze counters and classify every tracked identity
   * @return One Classification per tracked identity, registration order
   * @throws InvalidState unless Running
   */
  std::vector<Classification> stop() {
    if (status_ != Status::Running) {
      throw InvalidState(std::string("stop() while ") + status_name(status_));
    }
    status_ = Status::Stopped;

    const std::uint64_t required = total_scans_ == 0 ? 0 : threshold_.required(total_scans_);
    results_.clear();
    results_.reserve(identities_.size());
    for (std::size_t i = 0; i < identities_.size(); ++i) {
      Classification c;
      c.identity = identities_[i];
      c.detection_count = counts_[i];
      c.total_scans = total_scans_;
      c.required_detections = required;
      c.date = date_;
      c.present = threshold_.satisfied(counts_[i], total_scans_);
      results_.push_back(std::move(c));
    }

    emit("Attendance finalized. Total scans: " + std::to_string(total_scans_) +
         ". Threshold " + threshold_.to_string() + " (" + std::to_string(required) +
         " detections required).");
    return results_;
  }

  /**
   * @brief Result of stop(), available only once Stopped
   * @throws InvalidState before stop()
   */
  const std::vector<Classification>& classifications() const {
    if (status_ != Status::Stopped) {
      throw InvalidState(std::string("classifications() while ") + status_name(status_));
    }
    return results_;
  }

  Status status() const { return status_; }
  bool is_running() const { return status_ == Status::Running; }
  std::uint64_t total_scans() const { return total_scans_; }
  const std::vector<Identity>& identities() const { return identities_; }
  const ThresholdRatio& threshold() const { return threshold_; }
  std::chrono::milliseconds scan_interval() const { return scan_interval_; }
  const std::string& date() const { return date_; }
  std::chrono::system_clock::time_point started_at() const { return started_at_; }

  /**
   * @brief Detection count for a tracked identifier
   * @return count, or 0 for identifiers that are not tracked
   */
  std::uint64_t detection_count(const std::string& identifier) const {
    auto it = index_.find(identifier);
    return it == index_.end() ? 0 : counts_[it->second];
  }

  bool is_tracked(const std::string& identifier) const {
    return index_.count(identifier) != 0;
  }

  static const char* status_name(Status s) {
    switch (s) {
      case Status::NotStarted: return "NotStarted";
      case Status::Running: return "Running";
      case Status::Stopped: return "Stopped";
    }
    return "Unknown";
  }

private:
  std::string format_scan_line(const ScanOutcome& out) const {
    std::string line = "[SCAN " + std::to_string(out.scan_number) + "] Detected: ";
    if (out.seen.empty()) {
      line += "none";
    }
    for (std::size_t i = 0; i < out.seen.size(); ++i) {
      if (i) line += ", ";
      line += out.seen[i].display_name + " (" +
              std::to_string(detection_count(out.seen[i].identifier)) + ")";
    }
    line += " | Not found: ";
    if (out.missed.empty()) {
      line += "none";
    }
    for (std::size_t i = 0; i < out.missed.size(); ++i) {
      if (i) line += ", ";
      line += out.missed[i].display_name;
    }
    return line;
  }
};
