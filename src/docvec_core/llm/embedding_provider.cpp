#include "docvec_core/llm/embedding_provider.hpp"

#include "docvec_core/config.hpp"
#include "docvec_core/llm/gemini_client.hpp"
#include "docvec_core/llm/ollama_client.hpp"

namespace docvec_core {

std::string to_string(EmbeddingIntent intent) {
  switch (intent) {
    case EmbeddingIntent::Document:
      return "DOCUMENT";
    case EmbeddingIntent::Query:
      return "QUERY";
    default:
      return "UNKNOWN";
  }
}

std::unique_ptr<EmbeddingProvider> make_embedding_provider(const Config &config) {
  const size_t dimension = static_cast<size_t>(config.embedding_dimension);
  if (config.embedding_provider == Config::PROVIDER_OLLAMA) {
    OllamaClient::Options options;
    options.ollama_url = config.embedding_url;
    options.embedding_model = config.embedding_model;
    options.dimension = dimension;
    options.document_prefix = config.document_prefix;
    options.query_prefix = config.query_prefix;
    options.timeout_seconds = config.request_timeout_seconds;
    return std::make_unique<OllamaClient>(options);
  }

  GeminiClient::Options options;
  options.api_key = config.embedding_api_key;
  options.base_url = config.embedding_url;
  options.model = config.embedding_model;
  options.dimension = dimension;
  options.timeout_seconds = config.request_timeout_seconds;
  return std::make_unique<GeminiClient>(options);
}

}  // namespace docvec_core
