#include "bridge-server/BridgeConfig.hpp"
#include "bridge-server/plugin/LuaModule.hpp"

#include <cstdlib>
#include <fmt/format.h>

namespace bridgesrv {

CommandLineOptions parse_command_line(const std::vector<std::string> &args) {
  CommandLineOptions options;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];

    if (arg == "--help" || arg == "-h") {
      options.help = true;
      continue;
    }

    std::optional<std::string> *target = nullptr;
    if (arg == "--module") {
      target = &options.module;
    } else if (arg == "--config") {
      target = &options.config_path;
    } else if (arg == "--log-level") {
      target = &options.log_level;
    } else if (arg == "--log-file") {
      target = &options.log_file;
    } else {
      throw ConfigError("Unknown argument: " + arg);
    }

    if (i + 1 >= args.size()) {
      throw ConfigError("Missing value for " + arg);
    }
    *target = args[++i];
  }

  return options;
}

std::optional<spdlog::level::level_enum>
parse_log_level(const std::string &level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "info")
    return spdlog::level::info;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "critical")
    return spdlog::level::critical;
  if (level == "off")
    return spdlog::level::off;
  return std::nullopt;
}

void BridgeConfig::apply_yaml(const YAML::Node &node) {
  if (!node || node.IsNull()) {
    return;
  }
  if (!node.IsMap()) {
    throw ConfigError("Configuration must be a YAML mapping");
  }

  try {
    if (node["module"]) {
      module = node["module"].as<std::string>();
    }
    if (node["log_level"]) {
      log_level = node["log_level"].as<std::string>();
    }
    if (node["log_file"]) {
      log_file = node["log_file"].as<std::string>();
    }
    if (node["lua_libraries"]) {
      lua_libraries = node["lua_libraries"].as<std::vector<std::string>>();
    }
  } catch (const YAML::Exception &ex) {
    throw ConfigError(std::string("Invalid configuration value: ") +
                      ex.what());
  }
}

void BridgeConfig::load_yaml_file(const std::string &path) {
  YAML::Node node;
  try {
    node = YAML::LoadFile(path);
  } catch (const YAML::Exception &ex) {
    throw ConfigError(
        fmt::format("Failed to load config {}: {}", path, ex.what()));
  }
  apply_yaml(node);
}

void BridgeConfig::apply_environment() {
  if (const char *value = std::getenv("BRIDGE_SERVER_MODULE")) {
    module = value;
  }
  if (const char *value = std::getenv("BRIDGE_SERVER_LOG_LEVEL")) {
    log_level = value;
  }
  if (const char *value = std::getenv("BRIDGE_SERVER_LOG_FILE")) {
    log_file = value;
  }
}

void BridgeConfig::apply_command_line(const CommandLineOptions &options) {
  if (options.module) {
    module = *options.module;
  }
  if (options.log_level) {
    log_level = *options.log_level;
  }
  if (options.log_file) {
    log_file = *options.log_file;
  }
}

void BridgeConfig::validate() const {
  if (module.empty()) {
    throw ConfigError("No module given (use --module or BRIDGE_SERVER_MODULE)");
  }
  if (!parse_log_level(log_level)) {
    throw ConfigError("Unknown log level: " + log_level);
  }
  for (const auto &name : lua_libraries) {
    try {
      plugin::lua_library_from_name(name);
    } catch (const std::invalid_argument &ex) {
      throw ConfigError(ex.what());
    }
  }
}

spdlog::level::level_enum BridgeConfig::level() const {
  return parse_log_level(log_level).value_or(spdlog::level::info);
}

plugin::ModuleOptions BridgeConfig::module_options() const {
  plugin::ModuleOptions options;
  options.lua_libraries = lua_libraries;
  return options;
}

BridgeConfig BridgeConfig::resolve(const CommandLineOptions &options) {
  BridgeConfig config;
  if (options.config_path) {
    config.load_yaml_file(*options.config_path);
  }
  config.apply_environment();
  config.apply_command_line(options);
  return config;
}

} // namespace bridgesrv
