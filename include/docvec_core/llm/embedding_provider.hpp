#pragma once

#include <memory>
#include <string>
#include <vector>

namespace docvec_core {

class Config;

class EmbeddingError : public std::exception {
 public:
  explicit EmbeddingError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Provider-side task hint. Indexing always embeds Document, search always Query.
enum class EmbeddingIntent { Document, Query };

std::string to_string(EmbeddingIntent intent);

class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  // One synchronous provider call. No retries, no caching.
  virtual std::vector<float> embed(const std::string &text, EmbeddingIntent intent) = 0;

  virtual size_t dimension() const = 0;
  virtual std::string name() const = 0;
};

// Builds the provider selected by config.embedding_provider
std::unique_ptr<EmbeddingProvider> make_embedding_provider(const Config &config);

}  // namespace docvec_core
