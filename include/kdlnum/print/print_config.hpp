// kdlnum/print/print_config.hpp - Number printing configuration (kdlnum.yaml)
//
// Parses and validates the `print` section of kdlnum.yaml.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

namespace kdlnum
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Options recognized when writing a number back to text.
 */
struct PrintConfig
{
  /// Emit 0x / 0o / 0b prefixes and keep non-decimal digits
  bool respect_radix = true;

  /// Character substituted for the exponent marker of decimal floats ('E' or 'e')
  char exponent_char = 'E';
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  PrintConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(PrintConfig cfg)
  {
    ConfigLoadResult r;
    r.config = cfg;
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Parse configuration from YAML text.
 *
 * Missing keys keep their defaults; a missing `print` section is valid.
 */
[[nodiscard]] ConfigLoadResult parse_print_config(const std::string & yaml_text);

/**
 * Load configuration from a kdlnum.yaml file.
 *
 * @param config_path Path to kdlnum.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_print_config(const std::filesystem::path & config_path);

/**
 * Find kdlnum.yaml by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to kdlnum.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_print_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_print_config_file_name = "kdlnum.yaml";

}  // namespace kdlnum
