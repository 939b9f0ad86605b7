#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docvec_core/llm/embedding_provider.hpp"

namespace docvec_core {

class OllamaClient : public EmbeddingProvider {
 public:
  struct Options {
    std::string ollama_url = "http://localhost:11434";
    std::string embedding_model = "nomic-embed-text";
    size_t dimension = 768;
    // Task prefixes for models trained with them (nomic-embed-text convention)
    std::string document_prefix = "search_document: ";
    std::string query_prefix = "search_query: ";
    int timeout_seconds = 30;
  };

  explicit OllamaClient(Options options);

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<float> embed(const std::string &text, EmbeddingIntent intent) override;

  size_t dimension() const override { return options_.dimension; }
  std::string name() const override { return "ollama:" + options_.embedding_model; }

  // Text actually sent to the model for the given intent
  std::string prepare_input(const std::string &text, EmbeddingIntent intent) const;

  // Pulls the first vector out of an /api/embed response
  static std::vector<float> parse_embedding(const nlohmann::json &json_response);

 private:
  Options options_;

  void setup_server_connection();
};

}  // namespace docvec_core
