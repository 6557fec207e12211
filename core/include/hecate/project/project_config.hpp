// hecate/project/project_config.hpp - Toolkit configuration (hecate.yaml)
//
// Loads pool limits and diagnostic output settings. Every failure is
// reported through ConfigLoadResult; nothing here throws.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "hecate/ast/node_pool.hpp"

namespace hecate
{

// ============================================================================
// Configuration Structures
// ============================================================================

struct DiagnosticsConfig
{
  /// Colored terminal output in DiagnosticPrinter
  bool color = true;
};

/**
 * Complete toolkit configuration (hecate.yaml).
 *
 * @code
 *   pool:
 *     int_min: -128
 *     int_max: 127
 *     text_max_length: 50
 *     text_max_entries: 1000
 *     identifier_max_length: 30
 *     identifier_max_entries: 500
 *   diagnostics:
 *     color: false
 * @endcode
 */
struct ToolkitConfig
{
  PoolLimits pool;
  DiagnosticsConfig diagnostics;

  /// Directory containing hecate.yaml (empty when parsed from text)
  std::filesystem::path config_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ToolkitConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ToolkitConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
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
 * Load configuration from a hecate.yaml file.
 * Missing sections and keys keep their defaults.
 */
[[nodiscard]] ConfigLoadResult load_toolkit_config(const std::filesystem::path & config_path);

/// Parse configuration from YAML text
[[nodiscard]] ConfigLoadResult parse_toolkit_config(std::string_view yaml_text);

/**
 * Search for hecate.yaml from start_dir upward to the filesystem root.
 *
 * @return Path to the nearest hecate.yaml, std::nullopt if none
 */
[[nodiscard]] std::optional<std::filesystem::path> find_toolkit_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_toolkit_config_file_name = "hecate.yaml";

}  // namespace hecate
