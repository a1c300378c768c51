/**
 * @file Logging.cpp
 * @brief spdlog sink wiring.
 */

#include "src/logging/inc/Logging.hpp"

#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>

#include <fmt/core.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace proxwatch {

namespace logging {

namespace {

constexpr const char* CONSOLE_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%d %H:%M:%S] [%l] %v";

} // namespace

bool initLogging(const LogConfig& cfg, std::string& error) {
  std::vector<spdlog::sink_ptr> sinks;

  auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console->set_level(cfg.consoleLevel);
  console->set_pattern(CONSOLE_PATTERN);
  sinks.push_back(console);

  bool fileOk = true;
  if (!cfg.errorLogDir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(cfg.errorLogDir, ec);
    const std::filesystem::path PATH = std::filesystem::path(cfg.errorLogDir) / cfg.errorLogFile;

    try {
      auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(PATH.string(), false);
      file->set_level(spdlog::level::warn);
      file->set_pattern(FILE_PATTERN);
      sinks.push_back(file);
    } catch (const spdlog::spdlog_ex& ex) {
      error = fmt::format("cannot open error log {}: {}", PATH.string(), ex.what());
      fileOk = false;
    }
  }

  auto logger = std::make_shared<spdlog::logger>(cfg.name, sinks.begin(), sinks.end());
  // Logger level must admit everything a sink wants
  logger->set_level(cfg.consoleLevel < spdlog::level::warn ? cfg.consoleLevel
                                                           : spdlog::level::warn);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);

  return fileOk;
}

spdlog::level::level_enum parseLevel(const std::string& name) noexcept {
  const spdlog::level::level_enum LVL = spdlog::level::from_str(name);
  // from_str maps unknown names to off; only "off" itself should mean off
  if (LVL == spdlog::level::off && name != "off") {
    return spdlog::level::info;
  }
  return LVL;
}

void shutdownLogging() noexcept { spdlog::shutdown(); }

} // namespace logging

} // namespace proxwatch
