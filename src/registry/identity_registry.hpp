#pragma once
#include "../core/errors.hpp"
#include "../core/identity.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Known devices, in registration order
 *
 * Persisted as a JSON object keyed by device address:
 * { "AA:BB:CC:DD:EE:01": {"name": "Alice", "beacon_id": "AA:BB:CC:DD:EE:01"} }
 * Key order is preserved on load and save (ordered_json), so reports list
 * people in the order they were registered.
 *
 * Registration must not happen while a session is running; the attendance
 * loop enforces that. The mutex only keeps readers on other threads safe.
 */
class IdentityRegistry {
private:
  std::vector<Identity> identities_;
  std::unordered_map<std::string, std::size_t> index_;
  std::string path_;
  mutable std::mutex mutex_;

  static std::string trim(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
  }

public:
  /**
   * @param path JSON file backing this registry (empty = memory only)
   */
  explicit IdentityRegistry(std::string path = "") : path_(std::move(path)) {}

  const std::string& path() const { return path_; }

  /**
   * @brief Bind a device address to a person
   * @return The stored identity (name trimmed)
   * @throws RegistrationError on empty identifier or name, or if the
   *         address already belongs to someone
   */
  Identity register_device(const std::string& identifier, const std::string& display_name) {
    const std::string id = trim(identifier);
    const std::string name = trim(display_name);
    if (id.empty()) {
      throw RegistrationError("device identifier cannot be empty");
    }
    if (name.empty()) {
      throw RegistrationError("student name cannot be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(id);
    if (it != index_.end()) {
      throw RegistrationError("device " + id + " is already registered to " +
                              identities_[it->second].display_name);
    }
    index_.emplace(id, identities_.size());
    identities_.push_back(Identity{id, name});
    return identities_.back();
  }

  std::optional<Identity> find(const std::string& identifier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(identifier);
    if (it == index_.end()) {
      return std::nullopt;
    }
    return identities_[it->second];
  }

  bool contains(const std::string& identifier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(identifier) != 0;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return identities_.size();
  }

  bool empty() const {
    return size() == 0;
  }

  /**
   * @brief Copy of all identities in registration order
   */
  std::vector<Identity> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return identities_;
  }

  nlohmann::ordered_json to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& id : identities_) {
      j[id.identifier] = {{"name", id.display_name}, {"beacon_id", id.identifier}};
    }
    return j;
  }

  /**
   * @brief Replace contents from the JSON schema above
   *
   * Entries without a usable name are skipped. beacon_id falls back to the
   * key when absent.
   * @return number of identities loaded
   * @throws RegistrationError if the document is not an object
   */
  std::size_t from_json(const nlohmann::ordered_json& j) {
    if (!j.is_object()) {
      throw RegistrationError("registry document must be a JSON object");
    }
    std::vector<Identity> loaded;
    std::unordered_map<std::string, std::size_t> index;
    for (const auto& [key, value] : j.items()) {
      if (!value.is_object()) continue;
      std::string name = trim(value.value("name", std::string()));
      std::string id = trim(value.value("beacon_id", key));
      if (name.empty() || id.empty() || index.count(id)) continue;
      index.emplace(id, loaded.size());
      loaded.push_back(Identity{id, name});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    identities_ = std::move(loaded);
    index_ = std::move(index);
    return identities_.size();
  }

  /**
   * @brief Load from path()
   *
   * A missing file leaves the registry empty and returns false with an
   * explanatory message. A malformed file also leaves it empty.
   * @param message Human-readable outcome for the log
   * @return true if the file was read
   */
  bool load(std::string& message) {
    std::ifstream in(path_);
    if (!in) {
      message = "No existing registration file found at " + path_ + ". Starting a new registration.";
      return false;
    }
    auto j = nlohmann::ordered_json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      from_json(nlohmann::ordered_json::object());
      message = "Error loading registration file " + path_ + ": not a JSON object. Starting with an empty list.";
      return false;
    }
    const std::size_t n = from_json(j);
    message = "Loaded " + std::to_string(n) + " registered students from " + path_ + ".";
    return true;
  }

  /**
   * @brief Write to path() with 4-space indentation
   * @return false if the file could not be written
   */
  bool save(std::string& message) const {
    if (path_.empty()) {
      message = "Registry has no backing file.";
      return false;
    }
    const std::string text = to_json().dump(4);
    std::ofstream out(path_, std::ios::out | std::ios::trunc);
    if (!out) {
      message = "Error saving registration file " + path_;
      return false;
    }
    out << text << '\n';
    out.flush();
    if (!out) {
      message = "Error writing registration file " + path_;
      return false;
    }
    message = "Registered students saved to " + path_ + ".";
    return true;
  }
};
