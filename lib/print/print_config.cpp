// kdlnum/print/print_config.cpp - Print configuration implementation
//
#include "kdlnum/print/print_config.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace kdlnum
{

namespace
{

ConfigLoadResult read_root(const YAML::Node & root)
{
  PrintConfig config;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(config);
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  const YAML::Node print = root["print"];
  if (!print) {
    return ConfigLoadResult::ok(config);
  }
  if (!print.IsMap()) {
    return ConfigLoadResult::fail("print must be a map");
  }

  try {
    if (print["respect_radix"]) {
      config.respect_radix = print["respect_radix"].as<bool>();
    }

    if (print["exponent_char"]) {
      const auto text = print["exponent_char"].as<std::string>();
      if (text != "E" && text != "e") {
        return ConfigLoadResult::fail(
          "invalid print.exponent_char: '" + text + "' (must be 'E' or 'e')");
      }
      config.exponent_char = text.front();
    }
  } catch (const YAML::BadConversion & e) {
    return ConfigLoadResult::fail("invalid print section: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(config);
}

}  // namespace

ConfigLoadResult parse_print_config(const std::string & yaml_text)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return read_root(root);
}

ConfigLoadResult load_print_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  std::ifstream in(config_path);
  if (!in) {
    return ConfigLoadResult::fail("cannot open configuration file: " + config_path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parse_print_config(buffer.str());
}

std::optional<std::filesystem::path> find_print_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_print_config_file_name;
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

}  // namespace kdlnum
