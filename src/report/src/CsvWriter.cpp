/**
 * @file CsvWriter.cpp
 * @brief Daily CSV persistence of collection cycles.
 */

#include "src/report/inc/CsvWriter.hpp"
#include "src/helpers/inc/Files.hpp"

#include <cerrno>
#include <cstdio> // fopen, fwrite, fclose
#include <ctime>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace proxwatch {

namespace report {

namespace {

[[nodiscard]] std::string errnoText(int err) {
  return std::error_code(err, std::generic_category()).message();
}

[[nodiscard]] bool writeAll(std::FILE* file, const std::string& text) noexcept {
  return std::fwrite(text.data(), 1, text.size(), file) == text.size();
}

} // namespace

/* ----------------------------- Formatting ----------------------------- */

std::string escapeCsvField(std::string_view field) {
  if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string(field);
  }

  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (const char C : field) {
    if (C == '"') {
      out.push_back('"');
    }
    out.push_back(C);
  }
  out.push_back('"');
  return out;
}

std::string csvFileName(std::chrono::system_clock::time_point when) {
  const std::tm LOCAL = fmt::localtime(std::chrono::system_clock::to_time_t(when));
  return fmt::format("{}{:%Y%m%d}.csv", CSV_FILE_PREFIX, LOCAL);
}

std::string formatTimestamp(std::chrono::system_clock::time_point when) {
  const std::tm LOCAL = fmt::localtime(std::chrono::system_clock::to_time_t(when));
  return fmt::format("{:%Y-%m-%d %H:%M:%S}", LOCAL);
}

/* ----------------------------- CsvWriter ----------------------------- */

CsvWriter::CsvWriter(std::string dir, std::vector<std::string> metricNames,
                     std::vector<std::string> interfaceNames)
    : dir_(std::move(dir)), metricNames_(std::move(metricNames)),
      interfaceNames_(std::move(interfaceNames)) {}

std::string CsvWriter::header() const {
  std::string out = "timestamp,device_id,host";
  for (const std::string& name : metricNames_) {
    out += ',';
    out += escapeCsvField(name);
  }
  for (const std::string& name : interfaceNames_) {
    out += ',';
    out += escapeCsvField(name);
  }
  out += ",status";
  return out;
}

std::string CsvWriter::formatRow(const collector::ResourceRecord& record) const {
  std::string out = fmt::format("{},{},{}", formatTimestamp(record.collectedAt), record.deviceId,
                                escapeCsvField(record.host));

  for (const std::string& name : metricNames_) {
    out += ',';
    if (const auto VALUE = record.metric(name)) {
      out += fmt::format("{:.2f}", *VALUE);
    }
  }

  for (const std::string& name : interfaceNames_) {
    out += ',';
    if (const collector::InterfaceTraffic* traffic = record.findInterface(name)) {
      out += fmt::format("{:.2f}/{:.2f}", traffic->inBps, traffic->outBps);
    }
  }

  out += ',';
  if (record.failed) {
    out += escapeCsvField(record.errorMessage.empty() ? "failed" : record.errorMessage);
  } else {
    out += CSV_STATUS_OK;
  }
  return out;
}

bool CsvWriter::save(const std::vector<collector::ResourceRecord>& records, std::string& error) {
  return saveAt(records, std::chrono::system_clock::now(), error);
}

bool CsvWriter::saveAt(const std::vector<collector::ResourceRecord>& records,
                       std::chrono::system_clock::time_point now, std::string& error) {
  if (!helpers::files::ensureDirectory(dir_, error)) {
    return false;
  }

  const std::string PATH = (std::filesystem::path(dir_) / csvFileName(now)).string();

  std::error_code ec;
  const bool IS_NEW = !std::filesystem::exists(PATH, ec) ||
                      std::filesystem::file_size(PATH, ec) == 0 || ec;

  std::FILE* file = std::fopen(PATH.c_str(), "a");
  if (file == nullptr) {
    error = fmt::format("cannot open {}: {}", PATH, errnoText(errno));
    return false;
  }

  bool ok = true;
  if (IS_NEW) {
    ok = writeAll(file, header() + '\n');
  }
  for (const collector::ResourceRecord& record : records) {
    if (!ok) {
      break;
    }
    ok = writeAll(file, formatRow(record) + '\n');
  }

  const int WRITE_ERRNO = errno;
  if (std::fclose(file) != 0 && ok) {
    error = fmt::format("cannot close {}: {}", PATH, errnoText(errno));
    return false;
  }
  if (!ok) {
    error = fmt::format("cannot write {}: {}", PATH, errnoText(WRITE_ERRNO));
    return false;
  }

  lastPath_ = PATH;
  spdlog::debug("saved {} records to {}", records.size(), PATH);
  return true;
}

} // namespace report

} // namespace proxwatch
