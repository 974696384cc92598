// flowan/project/analysis_config.hpp - Analysis configuration (flowan.yaml)
//
// Parses and validates flowan.yaml files. The `analysis` section maps onto
// FlowOptions, the `output` section onto the CLI's presentation settings.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "flowan/sema/flow/flow_options.hpp"

namespace flowan
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class ColorMode : uint8_t {
  Auto,    ///< Color when stderr is a terminal
  Always,
  Never,
};

/**
 * Output configuration section.
 */
struct OutputConfig
{
  ColorMode color = ColorMode::Auto;

  /// Print the flow results of every function as JSON
  bool dump_flow = false;
};

/**
 * Complete analysis configuration (flowan.yaml).
 */
struct AnalysisConfig
{
  FlowOptions flow;
  OutputConfig output;

  /// File the configuration was read from (empty for defaults)
  std::filesystem::path config_path;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  AnalysisConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(AnalysisConfig cfg)
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
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a configuration from a flowan.yaml file.
 *
 * Unknown keys are ignored. A key holding the wrong kind of value fails the
 * whole load.
 */
[[nodiscard]] ConfigLoadResult load_analysis_config(const std::filesystem::path & config_path);

/// Same as load_analysis_config, for YAML already in memory.
[[nodiscard]] ConfigLoadResult load_analysis_config_text(const std::string & text);

/**
 * Search for flowan.yaml from @p start_dir up to the filesystem root.
 *
 * @param start_dir Directory (or file, whose parent is used) to start from
 */
[[nodiscard]] std::optional<std::filesystem::path> find_analysis_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_analysis_config_file_name = "flowan.yaml";

}  // namespace flowan
