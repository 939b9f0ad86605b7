#include "docvec_core/services/search_service.hpp"

#include <stdexcept>

namespace docvec_core {

SearchService::SearchService(std::shared_ptr<VectorStore> vector_store,
                             std::shared_ptr<EmbeddingProvider> embedding_provider)
    : vector_store_(std::move(vector_store)), embedding_provider_(std::move(embedding_provider)) {}

std::vector<SearchResult> SearchService::search(const std::string &query, int k) {
  if (k <= 0) {
    throw std::invalid_argument("Result count must be a positive integer, got " +
                                std::to_string(k));
  }
  std::vector<float> query_embedding = embed_query(query);

  // The store ranks through its index; hits arrive by ascending distance
  std::vector<VectorStoreHit> hits = vector_store_->query(query_embedding, k);

  std::vector<SearchResult> results;
  results.reserve(hits.size());
  for (auto &hit : hits) {
    results.push_back({std::move(hit.chunk_text), std::move(hit.filename), hit.similarity});
  }
  return results;
}

std::vector<float> SearchService::embed_query(const std::string &query) {
  try {
    return embedding_provider_->embed(query, EmbeddingIntent::Query);
  } catch (const EmbeddingError &e) {
    throw QueryEmbeddingError(query, e.what());
  }
}

}  // namespace docvec_core
