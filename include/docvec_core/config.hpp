#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace docvec_core {

class ConfigurationError : public std::exception {
 public:
  explicit ConfigurationError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class Config {
 public:
  static constexpr const char* DEFAULT_CONFIG_FILE = "docvecrc.json";
  static constexpr const char* PROVIDER_GEMINI = "gemini";
  static constexpr const char* PROVIDER_OLLAMA = "ollama";

  // Store
  std::string database_path;
  std::string database_key;
  std::string index_path;

  // Embedding provider
  std::string embedding_provider;
  std::string embedding_api_key;
  std::string embedding_url;
  std::string embedding_model;
  int embedding_dimension;
  int request_timeout_seconds;
  std::string document_prefix;
  std::string query_prefix;

  // Pipelines
  int sentences_per_chunk;
  int default_top_k;

  // Approximate index tuning
  int hnsw_m;
  int hnsw_ef_construction;
  int hnsw_ef_search;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    return from_json(read_json_file(filename));
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config = with_defaults(json_config);
    config.validate();
    return config;
  }

  // File (explicit path, else docvecrc.json when present), then environment, then validation
  static Config load(const std::optional<std::string>& config_path = std::nullopt) {
    nlohmann::json json_config = nlohmann::json::object();
    if (config_path) {
      json_config = read_json_file(*config_path);
    } else if (std::filesystem::exists(DEFAULT_CONFIG_FILE)) {
      json_config = read_json_file(DEFAULT_CONFIG_FILE);
    }

    apply_environment(json_config);
    return from_json(json_config);
  }

 private:
  static nlohmann::json read_json_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw ConfigurationError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception& e) {
      throw ConfigurationError(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }
    if (!json_config.is_object()) {
      throw ConfigurationError("Config file '" + filename + "' must contain a JSON object");
    }
    return json_config;
  }

  static void apply_environment(nlohmann::json& json_config) {
    auto override_from = [&](const char* key, std::initializer_list<const char*> variables) {
      for (const char* variable : variables) {
        const char* value = std::getenv(variable);
        if (value && *value) {
          json_config[key] = std::string(value);
          return;
        }
      }
    };
    override_from("database_path", {"DOCVEC_DATABASE_PATH"});
    override_from("database_key", {"DOCVEC_DATABASE_KEY"});
    override_from("index_path", {"DOCVEC_INDEX_PATH"});
    override_from("embedding_provider", {"DOCVEC_EMBEDDING_PROVIDER"});
    override_from("embedding_api_key", {"DOCVEC_EMBEDDING_API_KEY", "GEMINI_API_KEY"});
    override_from("embedding_url", {"DOCVEC_EMBEDDING_URL"});
    override_from("embedding_model", {"DOCVEC_EMBEDDING_MODEL"});
  }

  template <typename T>
  static T read_value(const nlohmann::json& json_config, const char* key, const T& fallback) {
    if (!json_config.contains(key) || json_config.at(key).is_null()) {
      return fallback;
    }
    try {
      return json_config.at(key).get<T>();
    } catch (const nlohmann::json::exception&) {
      throw ConfigurationError(std::string("Config value '") + key + "' has the wrong type");
    }
  }

  static Config with_defaults(const nlohmann::json& json_config) {
    Config config;

    config.database_path = read_value<std::string>(json_config, "database_path", "");
    config.database_key = read_value<std::string>(json_config, "database_key", "");
    config.index_path = read_value<std::string>(json_config, "index_path", "");
    if (config.index_path.empty() && !config.database_path.empty()) {
      config.index_path = config.database_path + ".faiss";
    }

    config.embedding_provider =
        read_value<std::string>(json_config, "embedding_provider", PROVIDER_GEMINI);
    const bool ollama = config.embedding_provider == PROVIDER_OLLAMA;
    config.embedding_api_key = read_value<std::string>(json_config, "embedding_api_key", "");
    config.embedding_url = read_value<std::string>(
        json_config, "embedding_url",
        ollama ? "http://localhost:11434" : "https://generativelanguage.googleapis.com/v1beta");
    config.embedding_model = read_value<std::string>(
        json_config, "embedding_model", ollama ? "nomic-embed-text" : "models/embedding-001");
    config.embedding_dimension = read_value<int>(json_config, "embedding_dimension", 768);
    config.request_timeout_seconds = read_value<int>(json_config, "request_timeout_seconds", 30);
    config.document_prefix =
        read_value<std::string>(json_config, "document_prefix", "search_document: ");
    config.query_prefix = read_value<std::string>(json_config, "query_prefix", "search_query: ");

    config.sentences_per_chunk = read_value<int>(json_config, "sentences_per_chunk", 3);
    config.default_top_k = read_value<int>(json_config, "default_top_k", 5);

    config.hnsw_m = read_value<int>(json_config, "hnsw_m", 32);
    config.hnsw_ef_construction = read_value<int>(json_config, "hnsw_ef_construction", 100);
    config.hnsw_ef_search = read_value<int>(json_config, "hnsw_ef_search", 64);
    return config;
  }

  void validate() const {
    if (database_path.empty()) {
      throw ConfigurationError(
          "database_path is not set (config file or DOCVEC_DATABASE_PATH)");
    }
    if (embedding_provider != PROVIDER_GEMINI && embedding_provider != PROVIDER_OLLAMA) {
      throw ConfigurationError("Unknown embedding_provider '" + embedding_provider +
                               "'. Expected 'gemini' or 'ollama'");
    }
    if (embedding_provider == PROVIDER_GEMINI && embedding_api_key.empty()) {
      throw ConfigurationError(
          "embedding_api_key is not set (config file, DOCVEC_EMBEDDING_API_KEY or "
          "GEMINI_API_KEY)");
    }
    if (embedding_url.empty()) {
      throw ConfigurationError("embedding_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw ConfigurationError("embedding_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw ConfigurationError("embedding_dimension must be greater than 0");
    }
    if (request_timeout_seconds <= 0) {
      throw ConfigurationError("request_timeout_seconds must be greater than 0");
    }
    if (sentences_per_chunk <= 0) {
      throw ConfigurationError("sentences_per_chunk must be greater than 0");
    }
    if (default_top_k <= 0) {
      throw ConfigurationError("default_top_k must be greater than 0");
    }
    if (hnsw_m < 2 || hnsw_ef_construction <= 0 || hnsw_ef_search <= 0) {
      throw ConfigurationError("hnsw_m must be at least 2 and hnsw_ef_* greater than 0");
    }
  }
};

}  // namespace docvec_core
