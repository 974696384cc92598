// flowan/project/analysis_config.cpp - Analysis configuration implementation
//
#include "flowan/project/analysis_config.hpp"

#include <yaml-cpp/yaml.h>

namespace flowan
{

namespace
{

/// Read an optional boolean key. Returns false with @p error set on a bad value.
bool read_flag(
  const YAML::Node & section, const char * section_name, const char * key, bool & out,
  std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) {
    return true;
  }
  if (!node.IsScalar()) {
    error = std::string(section_name) + "." + key + " must be true or false";
    return false;
  }
  try {
    out = node.as<bool>();
  } catch (const YAML::BadConversion &) {
    error = std::string(section_name) + "." + key + " must be true or false, got '" +
            node.Scalar() + "'";
    return false;
  }
  return true;
}

bool parse_color(const std::string & text, ColorMode & out)
{
  if (text == "auto") {
    out = ColorMode::Auto;
  } else if (text == "always") {
    out = ColorMode::Always;
  } else if (text == "never") {
    out = ColorMode::Never;
  } else {
    return false;
  }
  return true;
}

ConfigLoadResult parse_config(const YAML::Node & root)
{
  AnalysisConfig config;
  std::string error;

  // An empty document keeps every default.
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration must be a map");
  }

  // Parse 'analysis' section
  if (const YAML::Node analysis = root["analysis"]) {
    if (!analysis.IsMap()) {
      return ConfigLoadResult::fail("analysis must be a map");
    }
    FlowOptions & flow = config.flow;
    if (
      !read_flag(
        analysis, "analysis", "initialization_promotion", flow.initialization_promotion, error) ||
      !read_flag(analysis, "analysis", "assignment_promotion", flow.assignment_promotion, error) ||
      !read_flag(
        analysis, "analysis", "null_comparison_reachability", flow.null_comparison_reachability,
        error) ||
      !read_flag(analysis, "analysis", "report_dead_code", flow.report_dead_code, error) ||
      !read_flag(
        analysis, "analysis", "report_unassigned_reads", flow.report_unassigned_reads, error) ||
      !read_flag(
        analysis, "analysis", "report_missing_returns", flow.report_missing_returns, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  // Parse 'output' section
  if (const YAML::Node output = root["output"]) {
    if (!output.IsMap()) {
      return ConfigLoadResult::fail("output must be a map");
    }
    if (const YAML::Node color = output["color"]) {
      if (!color.IsScalar() || !parse_color(color.Scalar(), config.output.color)) {
        return ConfigLoadResult::fail(
          "invalid output.color (must be 'auto', 'always' or 'never')");
      }
    }
    if (!read_flag(output, "output", "dump_flow", config.output.dump_flow, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_analysis_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ConfigLoadResult result = parse_config(root);
  if (result.success) {
    result.config.config_path = fs::absolute(config_path);
  } else {
    result.error = config_path.string() + ": " + result.error;
  }
  return result;
}

ConfigLoadResult load_analysis_config_text(const std::string & text)
{
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_config(root);
}

std::optional<std::filesystem::path> find_analysis_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_analysis_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace flowan
