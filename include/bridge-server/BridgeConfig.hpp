#pragma once
#include "bridge-server/export.h"
#include "bridge-server/plugin/ModuleLoader.hpp"

#include <optional>
#include <spdlog/common.h>
#include <stdexcept>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace bridgesrv {

class BRIDGE_SERVER_API ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &message)
      : std::runtime_error(message) {}
};

/// Flags given on the command line; unset ones leave lower-precedence
/// sources alone
struct CommandLineOptions {
  std::optional<std::string> module;
  std::optional<std::string> config_path;
  std::optional<std::string> log_level;
  std::optional<std::string> log_file;
  bool help{false};
};

/// Parse argv[1..]; throws ConfigError on unknown flags or missing values
BRIDGE_SERVER_API CommandLineOptions
parse_command_line(const std::vector<std::string> &args);

/// trace/debug/info/warn/error/critical/off
BRIDGE_SERVER_API std::optional<spdlog::level::level_enum>
parse_log_level(const std::string &level);

struct BRIDGE_SERVER_API BridgeConfig {
  std::string module;
  std::string log_level{"info"};
  std::string log_file;
  std::vector<std::string> lua_libraries{"base", "string", "table", "math"};

  /// Overlay keys present in node (module, log_level, log_file,
  /// lua_libraries)
  void apply_yaml(const YAML::Node &node);
  void load_yaml_file(const std::string &path);

  /// Overlay BRIDGE_SERVER_MODULE, BRIDGE_SERVER_LOG_LEVEL and
  /// BRIDGE_SERVER_LOG_FILE when set
  void apply_environment();

  void apply_command_line(const CommandLineOptions &options);

  /// Throws ConfigError describing the first problem found
  void validate() const;

  spdlog::level::level_enum level() const;
  plugin::ModuleOptions module_options() const;

  /// defaults < YAML file (--config) < environment < command line
  static BridgeConfig resolve(const CommandLineOptions &options);
};

} // namespace bridgesrv
