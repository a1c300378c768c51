#ifndef PROXWATCH_HELPERS_ARGS_HPP
#define PROXWATCH_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities for the proxwatch tools.
 *
 * Fixed-arity flag parser plus typed accessors for the values it collects.
 * Cold-path only: every function may allocate.
 */

#include <algorithm>
#include <bitset>
#include <charconv>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <fmt/core.h>

namespace proxwatch {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--host"
  std::uint8_t nargs;      ///< Number of values required after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output (optional)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * When a flag is matched, the next nargs tokens are consumed literally as its
 * values. Unknown tokens are ignored. A flag given twice keeps the last values.
 *
 * @param args   Argument list (non-owning views; must outlive pargs).
 * @param map    Definitions of accepted flags and their requirements.
 * @param pargs  Output map of parsed values.
 * @param error  Optional error message target (set on failure when provided).
 * @return true on success; false on error.
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) {
  std::unordered_map<std::string_view, std::uint8_t> lut;
  lut.reserve(map.size());
  for (const auto& KV : map) {
    lut.emplace(KV.second.flag, KV.first);
  }

  std::bitset<256> seen;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto IT = lut.find(args[i]);
    if (IT == lut.end()) {
      continue;
    }

    const std::uint8_t KEY = IT->second;
    const ArgDef& DEF = map.at(KEY);

    // Values occupy [i + 1, i + nargs]
    if (i + DEF.nargs >= args.size()) {
      if (error) {
        error->get() = fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs);
      }
      return false;
    }

    auto& out = pargs[KEY];
    out.clear();
    for (std::uint8_t k = 0; k < DEF.nargs; ++k) {
      out.emplace_back(args[i + 1 + k]);
    }

    seen.set(KEY);
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && !seen.test(KV.first)) {
      if (error) {
        error->get() = fmt::format("Missing required argument '{}'", KV.second.flag);
      }
      return false;
    }
  }

  return true;
}

/* ----------------------------- Accessors ----------------------------- */

/// @brief True if the flag keyed by key was given.
[[nodiscard]] inline bool has(const ParsedArgs& pargs, std::uint8_t key) noexcept {
  return pargs.count(key) != 0;
}

/**
 * @brief First value of a flag, or a fallback when absent.
 */
[[nodiscard]] inline std::string_view valueOr(const ParsedArgs& pargs, std::uint8_t key,
                                              std::string_view fallback) noexcept {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return fallback;
  }
  return IT->second.front();
}

/**
 * @brief Parse a whole token as an unsigned decimal.
 * @param text Token to parse.
 * @param out Receives the value on success.
 * @return false on empty input, trailing garbage or overflow.
 */
[[nodiscard]] inline bool parseUnsigned(std::string_view text, std::uint64_t& out) noexcept {
  if (text.empty()) {
    return false;
  }
  std::uint64_t value = 0;
  const auto RES = std::from_chars(text.data(), text.data() + text.size(), value);
  if (RES.ec != std::errc{} || RES.ptr != text.data() + text.size()) {
    return false;
  }
  out = value;
  return true;
}

/* ----------------------------- Usage ----------------------------- */

/**
 * @brief Print usage information for a CLI tool.
 * @param progName    Program name (typically argv[0]).
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);

  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }

  fmt::print("Options:\n");

  std::vector<const ArgDef*> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.push_back(&KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  for (const ArgDef* def : entries) {
    std::string flagStr(def->flag);
    if (def->nargs == 1) {
      flagStr.append(" <value>");
    } else if (def->nargs > 1) {
      flagStr.append(" <value> ...");
    }

    fmt::print("  {:<24}  {}{}\n", flagStr, def->desc, def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace proxwatch

#endif // PROXWATCH_HELPERS_ARGS_HPP
