#ifndef PROXWATCH_REPORT_CSV_WRITER_HPP
#define PROXWATCH_REPORT_CSV_WRITER_HPP
/**
 * @file CsvWriter.hpp
 * @brief Daily CSV persistence of collection cycles.
 * @note NOT thread-safe: one writer per output directory, driven by the cycle thread.
 *
 * One file per local calendar day, resource_usage_YYYYMMDD.csv, opened in
 * append mode. The header is written only when the file is created:
 * @code
 *   timestamp,device_id,host,<metric names...>,<interface names...>,status
 * @endcode
 * Absent metrics and interfaces leave empty cells.
 */

#include "src/collector/inc/CollectionCycle.hpp"
#include "src/collector/inc/ResourceRecord.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace proxwatch {

namespace report {

/* ----------------------------- Constants ----------------------------- */

/// File name prefix; the local date and ".csv" follow.
inline constexpr std::string_view CSV_FILE_PREFIX = "resource_usage_";

/// Status cell of a record that was collected.
inline constexpr std::string_view CSV_STATUS_OK = "ok";

/* ----------------------------- Formatting ----------------------------- */

/**
 * @brief Quote a cell when it contains a comma, quote, CR or LF.
 *
 * Embedded quotes are doubled.
 */
[[nodiscard]] std::string escapeCsvField(std::string_view field);

/// @brief "resource_usage_YYYYMMDD.csv" for the local date of when.
[[nodiscard]] std::string csvFileName(std::chrono::system_clock::time_point when);

/// @brief "YYYY-mm-dd HH:MM:SS" in local time.
[[nodiscard]] std::string formatTimestamp(std::chrono::system_clock::time_point when);

/* ----------------------------- CsvWriter ----------------------------- */

/**
 * @brief RecordSink writing one CSV row per record.
 */
class CsvWriter final : public collector::RecordSink {
public:
  /**
   * @param dir Output directory, created on first save.
   * @param metricNames Metric columns in order.
   * @param interfaceNames Interface columns in order.
   */
  CsvWriter(std::string dir, std::vector<std::string> metricNames,
            std::vector<std::string> interfaceNames);

  bool save(const std::vector<collector::ResourceRecord>& records, std::string& error) override;

  /**
   * @brief Append records to the file for the local date of now.
   * @return false if the directory or file cannot be written; error names the path.
   */
  [[nodiscard]] bool saveAt(const std::vector<collector::ResourceRecord>& records,
                            std::chrono::system_clock::time_point now, std::string& error);

  /// @brief Header line without the trailing newline.
  [[nodiscard]] std::string header() const;

  /// @brief Row for one record without the trailing newline.
  [[nodiscard]] std::string formatRow(const collector::ResourceRecord& record) const;

  /// @brief Path written by the last successful save, empty before one.
  [[nodiscard]] const std::string& lastPath() const noexcept { return lastPath_; }

  [[nodiscard]] const std::string& directory() const noexcept { return dir_; }

private:
  std::string dir_;
  std::vector<std::string> metricNames_;
  std::vector<std::string> interfaceNames_;
  std::string lastPath_{};
};

} // namespace report

} // namespace proxwatch

#endif // PROXWATCH_REPORT_CSV_WRITER_HPP
