#pragma once
#include <string>

/**
 * @brief A registered person bound to one device identifier
 *
 * The identifier is the Bluetooth address (MAC-like, unique in a registry).
 */
struct Identity {
  std::string identifier;    ///< Device address, e.g. "AA:BB:CC:DD:EE:01"
  std::string display_name;  ///< Name shown in reports

  bool operator==(const Identity& other) const = default;
};
