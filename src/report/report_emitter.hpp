#pragma once
#include "../core/classification.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Writes the end-of-session attendance report
 *
 * One CSV row per classification:
 * Name,Beacon ID,Date,Status,Total Detections,Total Scans,Required Detections
 * File name is attendance_<date>.csv inside the report directory; a second
 * session on the same day overwrites the first, as the attendance sheet for
 * that day.
 */
class ReportEmitter {
public:
  static constexpr const char* kHeader =
      "Name,Beacon ID,Date,Status,Total Detections,Total Scans,Required Detections";

private:
  std::filesystem::path report_dir_;

public:
  explicit ReportEmitter(std::filesystem::path report_dir = ".")
    : report_dir_(std::move(report_dir)) {}

  const std::filesystem::path& report_dir() const { return report_dir_; }

  std::filesystem::path report_path(const std::string& date) const {
    return report_dir_ / ("attendance_" + date + ".csv");
  }

  /**
   * @brief Quote a CSV field if it contains a comma, quote or line break
   */
  static std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
      return field;
    }
    std::string out = "\"";
    for (char c : field) {
      if (c == '"') out += '"';
      out += c;
    }
    out += '"';
    return out;
  }

  static std::string csv_row(const Classification& c) {
    std::ostringstream oss;
    oss << csv_escape(c.identity.display_name) << ','
        << csv_escape(c.identity.identifier) << ','
        << c.date << ','
        << c.status() << ','
        << c.detection_count << ','
        << c.total_scans << ','
        << c.required_detections;
    return oss.str();
  }

  static std::string to_csv(const std::vector<Classification>& rows) {
    std::string out = std::string(kHeader) + "\n";
    for (const auto& c : rows) {
      out += csv_row(c) + "\n";
    }
    return out;
  }

  /**
   * @brief Fixed-width table for the log, one string per line
   */
  static std::vector<std::string> format_table(const std::vector<Classification>& rows) {
    std::size_t name_w = 4, id_w = 9;
    for (const auto& c : rows) {
      name_w = std::max(name_w, c.identity.display_name.size());
      id_w = std::max(id_w, c.identity.identifier.size());
    }

    auto line = [&](const std::string& name, const std::string& id, const std::string& date,
                    const std::string& status, const std::string& det, const std::string& scans,
                    const std::string& req) {
      std::ostringstream oss;
      oss << std::left << std::setw(static_cast<int>(name_w)) << name << "  "
          << std::setw(static_cast<int>(id_w)) << id << "  "
          << std::setw(10) << date << "  "
          << std::setw(7) << status << "  "
          << std::right << std::setw(10) << det << "  "
          << std::setw(5) << scans << "  "
          << std::setw(8) << req;
      return oss.str();
    };

    std::vector<std::string> out;
    out.push_back(line("Name", "Beacon ID", "Date", "Status", "Detections", "Scans", "Required"));
    for (const auto& c : rows) {
      out.push_back(line(c.identity.display_name, c.identity.identifier, c.date, c.status(),
                         std::to_string(c.detection_count), std::to_string(c.total_scans),
                         std::to_string(c.required_detections)));
    }
    return out;
  }

  static nlohmann::json to_json(const std::vector<Classification>& rows) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& c : rows) {
      arr.push_back({{"name", c.identity.display_name},
                     {"beacon_id", c.identity.identifier},
                     {"date", c.date},
                     {"status", c.status()},
                     {"total_detections", c.detection_count},
                     {"total_scans", c.total_scans},
                     {"required_detections", c.required_detections}});
    }
    return arr;
  }

  /**
   * @brief Write the CSV report
   * @param rows Classifications of one session (all share a date)
   * @param message Outcome for the log
   * @return Path written, or empty path on failure
   */
  std::filesystem::path emit(const std::vector<Classification>& rows, std::string& message) const {
    if (rows.empty()) {
      message = "No attendance data to export.";
      return {};
    }
    std::error_code ec;
    std::filesystem::create_directories(report_dir_, ec);
    if (ec) {
      message = "Error creating report directory " + report_dir_.string() + ": " + ec.message();
      return {};
    }

    const auto path = report_path(rows.front().date);
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
      message = "Error saving attendance file " + path.string();
      return {};
    }
    out << to_csv(rows);
    out.flush();
    if (!out) {
      message = "Error writing attendance file " + path.string();
      return {};
    }
    message = "Attendance data saved to " + path.string();
    return path;
  }
};
