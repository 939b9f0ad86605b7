#include "docvec_core/llm/ollama_client.hpp"

#include "ollama.hpp"

#include <utf8.h>

#include <iterator>
#include <utility>

namespace docvec_core {

OllamaClient::OllamaClient(Options options) : options_(std::move(options)) {
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  ollama::setServerURL(options_.ollama_url);
  ollama::setReadTimeout(options_.timeout_seconds);
  ollama::setWriteTimeout(options_.timeout_seconds);
}

std::string OllamaClient::prepare_input(const std::string &text, EmbeddingIntent intent) const {
  const std::string &prefix =
      intent == EmbeddingIntent::Query ? options_.query_prefix : options_.document_prefix;
  std::string input = prefix + text;
  if (utf8::is_valid(input.begin(), input.end())) {
    return input;
  }
  std::string cleaned;
  utf8::replace_invalid(input.begin(), input.end(), std::back_inserter(cleaned));
  return cleaned;
}

std::vector<float> OllamaClient::embed(const std::string &text, EmbeddingIntent intent) {
  std::vector<float> embedding;
  try {
    ollama::response response =
        ollama::generate_embeddings(options_.embedding_model, prepare_input(text, intent));
    embedding = parse_embedding(response.as_json());
  } catch (const ollama::exception &e) {
    throw EmbeddingError("Embedding generation failed (" + to_string(intent) +
                         "): " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError("Malformed embedding exchange (" + to_string(intent) +
                         "): " + std::string(e.what()));
  }

  if (embedding.size() != options_.dimension) {
    throw EmbeddingError("Ollama model " + options_.embedding_model + " returned " +
                         std::to_string(embedding.size()) + " dimensions, expected " +
                         std::to_string(options_.dimension));
  }
  return embedding;
}

std::vector<float> OllamaClient::parse_embedding(const nlohmann::json &json_response) {
  if (json_response.contains("error")) {
    throw EmbeddingError("Ollama error: " + json_response["error"].dump());
  }
  if (!json_response.contains("embeddings")) {
    throw EmbeddingError("Response does not contain embeddings field");
  }

  const auto &embeddings = json_response["embeddings"];
  if (!embeddings.is_array() || embeddings.empty()) {
    throw EmbeddingError("Embeddings field is not a non-empty array");
  }

  try {
    // Array of arrays for /api/embed, a flat array from older servers
    if (embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError("Embeddings field is malformed: " + std::string(e.what()));
  }
}

}  // namespace docvec_core
