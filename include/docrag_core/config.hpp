#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace docrag_core {

class Config {
 public:
  std::string index_db_path;
  std::string documents_dir;
  bool persistent_enabled;

  // Embedding
  std::string embedding_provider;
  std::string ollama_url;
  std::string embedding_model;
  int hashing_dimension;

  // Chunking and retrieval
  int chunk_size;
  int chunk_overlap;
  int default_top_k;

  int pool_size;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config must be a JSON object");
    }
    Config config;

    // Apply defaults when keys are missing
    config.index_db_path = json_config.value("index_db_path", std::string("./data/index/collection.db"));
    config.documents_dir = json_config.value("documents_dir", std::string("./data/documents"));
    config.persistent_enabled = json_config.value("persistent_enabled", true);

    config.embedding_provider = json_config.value("embedding_provider", std::string("ollama"));
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model = json_config.value("embedding_model", std::string("mxbai-embed-large"));

    // Integers fall back to their default when missing or of the wrong type
    config.hashing_dimension = int_or_default(json_config, "hashing_dimension", 384);
    config.chunk_size = int_or_default(json_config, "chunk_size", 512);
    config.chunk_overlap = int_or_default(json_config, "chunk_overlap", 50);
    config.default_top_k = int_or_default(json_config, "default_top_k", 5);
    config.pool_size = int_or_default(json_config, "pool_size", 4);

    config.validate();
    return config;
  }

  nlohmann::json to_json() const {
    return {{"index_db_path", index_db_path},
            {"documents_dir", documents_dir},
            {"persistent_enabled", persistent_enabled},
            {"embedding_provider", embedding_provider},
            {"ollama_url", ollama_url},
            {"embedding_model", embedding_model},
            {"hashing_dimension", hashing_dimension},
            {"chunk_size", chunk_size},
            {"chunk_overlap", chunk_overlap},
            {"default_top_k", default_top_k},
            {"pool_size", pool_size}};
  }

 private:
  static int int_or_default(const nlohmann::json& json_config, const char* key, int fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    try {
      return json_config.at(key).get<int>();
    } catch (const nlohmann::json::exception&) {
      return fallback;
    }
  }

  void validate() const {
    if (index_db_path.empty()) {
      throw std::runtime_error("index_db_path cannot be empty");
    }
    if (documents_dir.empty()) {
      throw std::runtime_error("documents_dir cannot be empty");
    }
    if (embedding_provider != "ollama" && embedding_provider != "hashing") {
      throw std::runtime_error("embedding_provider must be 'ollama' or 'hashing', got '" +
                               embedding_provider + "'");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (hashing_dimension <= 0) {
      throw std::runtime_error("hashing_dimension must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0) {
      throw std::runtime_error("chunk_overlap cannot be negative");
    }
    if (default_top_k <= 0) {
      throw std::runtime_error("default_top_k must be greater than 0");
    }
    if (pool_size <= 0) {
      throw std::runtime_error("pool_size must be greater than 0");
    }
  }
};

}  // namespace docrag_core
