#pragma once
#include <cstdint>
#include <string>
#include "identity.hpp"

/**
 * @brief Final present/absent determination for one identity
 *
 * Produced once by SessionTracker::stop() over frozen counters and never
 * mutated afterwards. Carries every column the attendance report needs.
 */
struct Classification {
  Identity identity;
  std::uint64_t detection_count{0};      ///< Scans in which the device was seen
  std::uint64_t total_scans{0};          ///< Completed scan cycles in the session
  std::uint64_t required_detections{0};  ///< Smallest count meeting the threshold
  std::string date;                      ///< Session date, YYYY-MM-DD
  bool present{false};

  const char* status() const { return present ? "Present" : "Absent"; }
};
