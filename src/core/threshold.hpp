#pragma once
#include <cmath>
#include <cstdint>
#include <numeric>
#include <string>
#include "errors.hpp"

/**
 * @brief Attendance threshold held as an exact fraction
 *
 * The presence rule is evaluated in integer arithmetic,
 * count * den >= num * total, so that e.g. 0.8 of 10 scans is exactly 8.
 */
struct ThresholdRatio {
  std::uint64_t num{4};  ///< Numerator
  std::uint64_t den{5};  ///< Denominator (never zero)

  /**
   * @brief Build a ratio from a decimal value (at most 6 decimal places kept)
   * @param r Fraction in (0, 1]
   * @throws InvalidConfiguration if r is not in (0, 1]
   */
  static ThresholdRatio from_double(double r) {
    if (!std::isfinite(r) || r <= 0.0 || r > 1.0) {
      throw InvalidConfiguration("threshold ratio must be in (0,1], got " + std::to_string(r));
    }
    constexpr std::uint64_t scale = 1000000;
    auto n = static_cast<std::uint64_t>(std::llround(r * static_cast<double>(scale)));
    if (n == 0) {
      throw InvalidConfiguration("threshold ratio too small: " + std::to_string(r));
    }
    return make(n, scale);
  }

  /**
   * @brief Build a ratio from an explicit fraction
   * @throws InvalidConfiguration unless 0 < n <= d
   */
  static ThresholdRatio make(std::uint64_t n, std::uint64_t d) {
    if (d == 0 || n == 0 || n > d) {
      throw InvalidConfiguration("threshold ratio must be in (0,1], got " +
                                 std::to_string(n) + "/" + std::to_string(d));
    }
    std::uint64_t g = std::gcd(n, d);
    return ThresholdRatio{n / g, d / g};
  }

  double as_double() const { return static_cast<double>(num) / static_cast<double>(den); }

  /**
   * @brief Smallest detection count that satisfies the threshold
   * @param total_scans Completed scan cycles
   * @return ceil(num * total / den)
   */
  std::uint64_t required(std::uint64_t total_scans) const {
    return (num * total_scans + den - 1) / den;
  }

  /**
   * @brief Presence rule. Zero scans is never present.
   */
  bool satisfied(std::uint64_t detections, std::uint64_t total_scans) const {
    if (total_scans == 0) return false;
    return detections * den >= num * total_scans;
  }

  std::string to_string() const {
    return std::to_string(num) + "/" + std::to_string(den);
  }
};
