#include "docrag_cli/cli_handler.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "docrag_core/chunking/text_chunker.hpp"
#include "docrag_core/service_provider.hpp"
#include "docrag_core/services/document_service.hpp"
#include "docrag_core/services/retrieval_service.hpp"

namespace docrag_cli {

namespace {

int parse_top_k(const std::string &value) {
  int top_k = 0;
  try {
    size_t consumed = 0;
    top_k = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw CliError("Invalid value for --top-k: " + value);
    }
  } catch (const std::logic_error &) {
    throw CliError("Invalid value for --top-k: " + value);
  }
  if (top_k <= 0) {
    throw CliError("--top-k must be greater than 0");
  }
  return top_k;
}

}  // namespace

CliHandler::CliHandler(const docrag_core::Config &config) : config_(config) {}

docrag_core::ServiceProvider &CliHandler::services() {
  if (!services_) {
    services_ = docrag_core::ServiceProvider::from_config(config_);
  }
  return *services_;
}

CliOptions CliHandler::parse_arguments(int argc, char *argv[]) {
  CliOptions options;

  int index = 1;
  // Global options come before the command
  while (index < argc && std::string(argv[index]) == "--config") {
    if (index + 1 >= argc) {
      throw CliError("--config requires a path. Usage: --config <path> <command>");
    }
    options.config_path = argv[index + 1];
    index += 2;
  }

  if (index >= argc) {
    options.command = Command::Help;
    return options;
  }

  std::string command = argv[index++];

  auto for_each_flag = [&](const auto &handle) {
    for (int i = index; i < argc; i += 2) {
      std::string flag = argv[i];
      if (i + 1 >= argc) {
        throw CliError("Missing value for " + flag);
      }
      handle(flag, std::string(argv[i + 1]));
    }
  };

  if (command == "ingest" || command == "i") {
    options.command = Command::Ingest;
    for_each_flag([&](const std::string &flag, const std::string &value) {
      if (flag == "--file" || flag == "-f") {
        options.file_path = value;
      } else {
        throw CliError("Unknown option for ingest: " + flag);
      }
    });
    if (options.file_path.empty()) {
      throw CliError("Ingest command requires a file path. Usage: ingest --file <path>");
    }
  } else if (command == "search" || command == "s") {
    options.command = Command::Search;
    for_each_flag([&](const std::string &flag, const std::string &value) {
      if (flag == "--query" || flag == "-q") {
        options.query = value;
      } else if (flag == "--top-k" || flag == "-k") {
        options.top_k = parse_top_k(value);
      } else {
        throw CliError("Unknown option for search: " + flag);
      }
    });
    if (options.query.empty()) {
      throw CliError("Search command requires a query. Usage: search --query <query>");
    }
  } else if (command == "delete" || command == "d") {
    options.command = Command::Delete;
    for_each_flag([&](const std::string &flag, const std::string &value) {
      if (flag == "--id" || flag == "-i") {
        options.doc_id = value;
      } else {
        throw CliError("Unknown option for delete: " + flag);
      }
    });
    if (options.doc_id.empty()) {
      throw CliError("Delete command requires a document id. Usage: delete --id <doc_id>");
    }
  } else if (command == "chunk" || command == "c") {
    options.command = Command::Chunk;
    for_each_flag([&](const std::string &flag, const std::string &value) {
      if (flag == "--file" || flag == "-f") {
        options.file_path = value;
      } else {
        throw CliError("Unknown option for chunk: " + flag);
      }
    });
    if (options.file_path.empty()) {
      throw CliError("Chunk command requires a file path. Usage: chunk --file <path>");
    }
  } else if (command == "list" || command == "l") {
    options.command = Command::List;
  } else if (command == "stats") {
    options.command = Command::Stats;
  } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
    options.command = Command::Help;
  } else {
    throw CliError("Unknown command: " + command);
  }

  return options;
}

void CliHandler::execute_command(const CliOptions &options) {
  switch (options.command) {
    case Command::Ingest:
      handle_ingest_command(options);
      break;
    case Command::Search:
      handle_search_command(options);
      break;
    case Command::Delete:
      handle_delete_command(options);
      break;
    case Command::List:
      handle_list_command();
      break;
    case Command::Stats:
      handle_stats_command();
      break;
    case Command::Chunk:
      handle_chunk_command(options);
      break;
    case Command::Help:
      print_help();
      break;
  }
}

void CliHandler::handle_ingest_command(const CliOptions &options) {
  std::cerr << "[CLI] Ingesting file: " << options.file_path << std::endl;
  docrag_core::IngestResult result =
      services().get_document_service().ingest_file(options.file_path);
  print_json_response({{"doc_id", result.record.doc_id},
                       {"filename", result.record.filename},
                       {"chunks_created", result.record.chunk_count}});
}

void CliHandler::handle_search_command(const CliOptions &options) {
  const int top_k = options.top_k > 0 ? options.top_k : config_.default_top_k;
  std::cout << "Search for: " << options.query << " (top_k: " << top_k << ")" << std::endl;

  docrag_core::SearchOutcome outcome = services().get_retrieval_service().search(
      options.query, static_cast<size_t>(top_k));
  if (!outcome.ok()) {
    throw CliError("Search failed: " + outcome.error);
  }

  std::cout << "\n=== Search Results ===" << std::endl;
  if (outcome.results.empty()) {
    std::cout << "No matching chunks." << std::endl;
    return;
  }
  int rank = 1;
  for (const auto &hit : outcome.results) {
    std::cout << rank++ << ". " << hit.metadata.filename << " [chunk "
              << hit.metadata.chunk_index << "] (distance: " << std::fixed
              << std::setprecision(3) << hit.distance << ")" << std::endl;
    std::string preview = hit.content.substr(0, 200);
    if (hit.content.size() > preview.size()) {
      preview += "...";
    }
    std::cout << "   " << preview << std::endl;
  }
}

void CliHandler::handle_delete_command(const CliOptions &options) {
  if (!services().get_document_service().remove_document(options.doc_id)) {
    throw CliError("Document not found: " + options.doc_id);
  }
  print_json_response({{"message", "Document deleted"}, {"doc_id", options.doc_id}});
}

void CliHandler::handle_list_command() {
  nlohmann::json documents = nlohmann::json::array();
  for (const auto &record : services().get_document_service().list_documents()) {
    documents.push_back(record);
  }
  print_json_response({{"documents", documents}});
}

void CliHandler::handle_stats_command() {
  nlohmann::json stats = services().get_retrieval_service().stats();
  print_json_response(stats);
}

void CliHandler::handle_chunk_command(const CliOptions &options) {
  std::ifstream file_stream(options.file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw CliError("Could not open file: " + options.file_path);
  }
  std::stringstream buffer;
  buffer << file_stream.rdbuf();

  docrag_core::TextChunker chunker(static_cast<size_t>(config_.chunk_size),
                                   static_cast<size_t>(config_.chunk_overlap));
  const auto chunks = chunker.chunk(buffer.str());
  std::cout << chunks.size() << " chunk(s)" << std::endl;
  for (size_t i = 0; i < chunks.size(); ++i) {
    std::cout << "--- chunk " << i << " ---" << std::endl;
    std::cout << chunks[i] << std::endl;
  }
}

void CliHandler::print_json_response(const nlohmann::json &response) {
  std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_help() {
  std::cout << "docrag - document retrieval from the command line\n\n"
            << "Usage: docrag_cli [--config <path>] <command> [options]\n\n"
            << "Commands:\n"
            << "  ingest (i)  --file <path>                Chunk, embed and index a text file\n"
            << "  search (s)  --query <query> [--top-k N]  Search indexed chunks\n"
            << "  delete (d)  --id <doc_id>                Remove a document and its chunks\n"
            << "  list   (l)                               List ingested documents\n"
            << "  stats                                    Show collection statistics\n"
            << "  chunk  (c)  --file <path>                Print the chunks of a file\n"
            << "  help   (h)                               Show this help\n\n"
            << "The config file defaults to ./docragrc.json; built-in defaults apply when it is "
               "missing.\n";
}

}  // namespace docrag_cli
