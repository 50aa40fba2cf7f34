#include <filesystem>
#include <iostream>

#include "docrag_cli/cli_handler.hpp"

int main(int argc, char *argv[]) {
  try {
    docrag_cli::CliOptions options = docrag_cli::CliHandler::parse_arguments(argc, argv);

    // A missing default config file means built-in defaults; an explicit one must exist
    const bool explicit_config = options.config_path != docrag_cli::DEFAULT_CONFIG_PATH;
    if (explicit_config && !std::filesystem::exists(options.config_path)) {
      throw docrag_cli::CliError("Config file not found: " + options.config_path);
    }
    docrag_core::Config config = std::filesystem::exists(options.config_path)
                                     ? docrag_core::Config::from_file(options.config_path)
                                     : docrag_core::Config::from_json(nlohmann::json::object());

    docrag_cli::CliHandler handler(config);
    handler.execute_command(options);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
