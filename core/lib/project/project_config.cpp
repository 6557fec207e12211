// hecate/project/project_config.cpp - Toolkit configuration implementation
//
#include "hecate/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>

namespace hecate
{

namespace
{

/// Read an integer key into `out`; returns false (with `error`) on bad input
bool read_int(const YAML::Node & section, const char * key, int64_t & out, std::string & error)
{
  const YAML::Node value = section[key];
  if (!value) {
    return true;
  }
  if (!value.IsScalar()) {
    error = std::string("pool.") + key + " must be an integer";
    return false;
  }
  try {
    out = value.as<int64_t>();
  } catch (const YAML::Exception &) {
    error = std::string("pool.") + key + " must be an integer, got '" + value.Scalar() + "'";
    return false;
  }
  return true;
}

bool read_count(const YAML::Node & section, const char * key, size_t & out, std::string & error)
{
  int64_t value = static_cast<int64_t>(out);
  if (!read_int(section, key, value, error)) {
    return false;
  }
  if (value < 0) {
    error = std::string("pool.") + key + " must not be negative";
    return false;
  }
  out = static_cast<size_t>(value);
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root, ToolkitConfig config)
{
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'pool' section
  if (const YAML::Node pool = root["pool"]) {
    if (!pool.IsMap()) {
      return ConfigLoadResult::fail("pool must be a map");
    }
    PoolLimits & limits = config.pool;
    std::string error;
    if (
      !read_int(pool, "int_min", limits.int_min, error) ||
      !read_int(pool, "int_max", limits.int_max, error) ||
      !read_count(pool, "text_max_length", limits.text_max_length, error) ||
      !read_count(pool, "text_max_entries", limits.text_max_entries, error) ||
      !read_count(pool, "identifier_max_length", limits.identifier_max_length, error) ||
      !read_count(pool, "identifier_max_entries", limits.identifier_max_entries, error)) {
      return ConfigLoadResult::fail(error);
    }
    if (limits.int_min > limits.int_max) {
      return ConfigLoadResult::fail(
        "pool.int_min (" + std::to_string(limits.int_min) + ") is greater than pool.int_max (" +
        std::to_string(limits.int_max) + ")");
    }
  }

  // Parse 'diagnostics' section
  if (const YAML::Node diagnostics = root["diagnostics"]) {
    if (!diagnostics.IsMap()) {
      return ConfigLoadResult::fail("diagnostics must be a map");
    }
    if (const YAML::Node color = diagnostics["color"]) {
      try {
        config.diagnostics.color = color.as<bool>();
      } catch (const YAML::Exception &) {
        return ConfigLoadResult::fail("diagnostics.color must be true or false");
      }
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_toolkit_config(std::string_view yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml_text));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_root(root, ToolkitConfig{});
}

ConfigLoadResult load_toolkit_config(const std::filesystem::path & config_path)
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

  ToolkitConfig config;
  config.config_root = fs::absolute(config_path).parent_path();
  return parse_root(root, std::move(config));
}

std::optional<std::filesystem::path> find_toolkit_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_toolkit_config_file_name;
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

}  // namespace hecate
