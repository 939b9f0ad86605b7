#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docvec_core/db/vector_store.hpp"
#include "docvec_core/llm/embedding_provider.hpp"

namespace docvec_core {

// The query could not be embedded; there is no fallback ranking
class QueryEmbeddingError : public std::exception {
 public:
  QueryEmbeddingError(const std::string &query, const std::string &cause)
      : query_(query), message_("Failed to embed query '" + query + "': " + cause) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  const std::string &query() const { return query_; }

 private:
  std::string query_;
  std::string message_;
};

struct SearchResult {
  std::string chunk_text;
  std::string filename;
  // 1 - cosine distance, in [0, 1]
  float score;
};

class SearchService {
 public:
  static constexpr int DEFAULT_TOP_K = 5;

  SearchService(std::shared_ptr<VectorStore> vector_store,
                std::shared_ptr<EmbeddingProvider> embedding_provider);

  // Natural-language semantic search over every stored chunk. Returns top-k by descending score.
  std::vector<SearchResult> search(const std::string &query, int k = DEFAULT_TOP_K);

 private:
  std::vector<float> embed_query(const std::string &query);

  std::shared_ptr<VectorStore> vector_store_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
};

}  // namespace docvec_core
