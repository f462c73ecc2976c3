#pragma once
#include <chrono>

/**
 * @brief Bounds for scan timing
 *
 * The configuration file is validated against these; "set_interval" and
 * "start" commands are clamped to them.
 */
struct Limits {
  double interval_min_s{0.1};     ///< Shortest pause between scan cycles
  double interval_max_s{3600.0};  ///< Longest pause between scan cycles
  double duration_max_s{3600.0};  ///< Longest single inquiry

  /**
   * @brief Clamp an interval to [interval_min_s, interval_max_s] (NaN maps to the minimum)
   */
  double clamp(double v) const {
    if (!(v >= interval_min_s)) return interval_min_s;
    if (v > interval_max_s) return interval_max_s;
    return v;
  }

  bool interval_ok(double v) const {
    return v >= interval_min_s && v <= interval_max_s;
  }

  bool duration_ok(double v) const {
    return v > 0.0 && v <= duration_max_s;
  }

  std::chrono::milliseconds clamp_interval(double seconds) const {
    return std::chrono::milliseconds(static_cast<long long>(clamp(seconds) * 1000.0));
  }

  /// Duration in (0, duration_max_s]; anything else maps to one millisecond or the maximum
  std::chrono::milliseconds clamp_duration(double seconds) const {
    if (!(seconds > 0.001)) return std::chrono::milliseconds(1);
    if (seconds > duration_max_s) seconds = duration_max_s;
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
  }
};
