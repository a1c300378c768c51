#ifndef PROXWATCH_HELPERS_FILES_HPP
#define PROXWATCH_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Whole-file reads and directory creation for configuration and reports.
 *
 * Cold-path helpers: they allocate and report failure through an error string.
 */

#include <fcntl.h>  // open, O_RDONLY, O_CLOEXEC
#include <unistd.h> // read, close

#include <cerrno>
#include <filesystem>
#include <string>
#include <system_error>

#include <fmt/core.h>

namespace proxwatch {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Chunk size for whole-file reads.
inline constexpr std::size_t FILE_READ_CHUNK_SIZE = 4096;

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read an entire file into a string.
 * @param path File path to read.
 * @param out Receives the contents (cleared first).
 * @param error Receives a description on failure.
 * @return false if the file cannot be opened or read.
 */
[[nodiscard]] inline bool readTextFile(const std::string& path, std::string& out,
                                       std::string& error) {
  out.clear();

  const int FD = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    error = fmt::format("cannot open {}: {}",
                        path, std::error_code(errno, std::generic_category()).message());
    return false;
  }

  char buf[FILE_READ_CHUNK_SIZE];
  while (true) {
    const ssize_t N = ::read(FD, buf, sizeof(buf));
    if (N == 0) {
      break;
    }
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = fmt::format("cannot read {}: {}",
                          path, std::error_code(errno, std::generic_category()).message());
      ::close(FD);
      return false;
    }
    out.append(buf, static_cast<std::size_t>(N));
  }

  ::close(FD);
  return true;
}

/* ----------------------------- Directories ----------------------------- */

/**
 * @brief Create a directory and its parents if missing.
 * @return false if the path cannot be created or exists as a non-directory.
 */
[[nodiscard]] inline bool ensureDirectory(const std::string& path, std::string& error) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    error = fmt::format("cannot create directory {}: {}", path, ec.message());
    return false;
  }
  if (!std::filesystem::is_directory(path, ec)) {
    error = fmt::format("{} is not a directory", path);
    return false;
  }
  return true;
}

} // namespace files
} // namespace helpers
} // namespace proxwatch

#endif // PROXWATCH_HELPERS_FILES_HPP
