#include "bridge-server/BridgeConfig.hpp"
#include "bridge-server/Logger.hpp"
#include "bridge-server/context/ExecutionContext.hpp"
#include "bridge-server/plugin/ModuleLoader.hpp"
#include "bridge-server/rpc/Dispatcher.hpp"
#include "bridge-server/rpc/ProtocolLoop.hpp"
#include "bridge-server/rpc/ProtocolOutput.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace bridgesrv;

void print_usage() {
  std::cerr << "Usage: bridge-server --module <path> [options]\n\n";
  std::cerr << "Serves JSON-RPC requests, one per line, on stdin/stdout.\n";
  std::cerr << "\nOptions:\n";
  std::cerr << "  --module <path>      Extension module (.lua script or "
               ".so/.dll)\n";
  std::cerr << "  --config <file>      YAML configuration file\n";
  std::cerr << "  --log-level <level>  trace|debug|info|warn|error|critical|off "
               "(default: info)\n";
  std::cerr << "  --log-file <path>    Also log to a rotating file\n";
  std::cerr << "  --help               Show this help\n";
  std::cerr << "\nEnvironment:\n";
  std::cerr << "  BRIDGE_SERVER_MODULE, BRIDGE_SERVER_LOG_LEVEL, "
               "BRIDGE_SERVER_LOG_FILE\n";
}

int main(int argc, char **argv) {
  BridgeConfig config;
  try {
    auto options =
        parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
    if (options.help) {
      print_usage();
      return 0;
    }
    config = BridgeConfig::resolve(options);
    config.validate();
  } catch (const ConfigError &ex) {
    std::cerr << "Error: " << ex.what() << "\n\n";
    print_usage();
    return 1;
  }

  BridgeLogger::instance().init(config.level(), config.log_file);

  std::unique_ptr<rpc::ProtocolOutput> output;
  try {
    output = rpc::ProtocolOutput::claim_stdout();
  } catch (const std::exception &ex) {
    LOG_ERROR("MAIN", "STARTUP", "{}", ex.what());
    return 1;
  }

  std::unique_ptr<plugin::LoadedModule> module;
  try {
    module = plugin::load_module(config.module, config.module_options());
  } catch (const plugin::ModuleLoadError &ex) {
    LOG_ERROR("MAIN", "STARTUP", "Failed to load module {}: {}", config.module,
              ex.what());
    return 1;
  } catch (const std::exception &ex) {
    LOG_ERROR("MAIN", "STARTUP", "Unexpected error loading module {}: {}",
              config.module, ex.what());
    return 1;
  }

  const CallableRegistry &registry = module->registry();
  LOG_INFO("MAIN", "STARTUP", "Module: {} ({})", module->path(),
           plugin::to_string(module->kind()));
  LOG_INFO("MAIN", "STARTUP", "Functions: {}",
           join_names(registry.function_names()));
  LOG_INFO("MAIN", "STARTUP", "Assertions: {}",
           join_names(registry.assertion_names()));
  LOG_INFO("MAIN", "STARTUP", "Hooks: {}", join_names(registry.hook_names()));

  ExecutionContext context;
  rpc::Dispatcher dispatcher(registry, context);
  rpc::ProtocolLoop loop(dispatcher);

  LOG_INFO("MAIN", "SERVE", "Bridge ready; reading requests from stdin");
  loop.run(std::cin, output->stream());

  LOG_INFO("MAIN", "SHUTDOWN", "Shutting down");
  return 0;
}
