#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "docrag_core/config.hpp"

namespace docrag_core {
class ServiceProvider;
}

namespace docrag_cli {

inline constexpr const char *DEFAULT_CONFIG_PATH = "docragrc.json";

enum class Command { Ingest, Search, Delete, List, Stats, Chunk, Help };

struct CliOptions {
  Command command = Command::Help;
  std::string config_path = DEFAULT_CONFIG_PATH;
  std::string file_path;
  std::string query;
  std::string doc_id;
  int top_k = 0;  // 0 means the configured default_top_k
};

class CliError : public std::exception {
 public:
  explicit CliError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class CliHandler {
 public:
  explicit CliHandler(const docrag_core::Config &config);

  CliHandler(const CliHandler &) = delete;
  CliHandler &operator=(const CliHandler &) = delete;

  // Parse command line arguments; never touches the services
  static CliOptions parse_arguments(int argc, char *argv[]);

  // Execute command. Failures surface as exceptions for main() to report.
  void execute_command(const CliOptions &options);

  static void print_help();

 private:
  docrag_core::Config config_;
  std::shared_ptr<docrag_core::ServiceProvider> services_;

  // Services are built on first use so help and chunk run without a backend
  docrag_core::ServiceProvider &services();

  void handle_ingest_command(const CliOptions &options);
  void handle_search_command(const CliOptions &options);
  void handle_delete_command(const CliOptions &options);
  void handle_list_command();
  void handle_stats_command();
  void handle_chunk_command(const CliOptions &options);

  static void print_json_response(const nlohmann::json &response);
};

}  // namespace docrag_cli
