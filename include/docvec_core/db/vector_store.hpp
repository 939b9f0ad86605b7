#pragma once
#include <faiss/IndexHNSW.h>
#include <faiss/IndexIDMap.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "docvec_core/db/database_manager.hpp"

namespace docvec_core {

class VectorStoreError : public std::exception {
 public:
  explicit VectorStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// A batch write failed; none of its rows were committed
class VectorStoreInsertError : public VectorStoreError {
 public:
  using VectorStoreError::VectorStoreError;
};

// A row to persist. The store assigns id and created_at.
struct VectorRecord {
  std::string filename;
  std::string chunk_text;
  std::vector<float> embedding;
  std::string split_strategy;
};

struct VectorStoreHit {
  int64_t id = 0;
  std::string filename;
  std::string chunk_text;
  std::string split_strategy;
  std::chrono::system_clock::time_point created_at;
  // Cosine distance in [0, 2]; similarity is 1 - distance clamped to [0, 1]
  float distance = 0.0f;
  float similarity = 0.0f;
};

struct VectorStoreOptions {
  size_t dimension = 768;
  std::filesystem::path index_path;
  int hnsw_m = 32;
  int hnsw_ef_construction = 100;
  int hnsw_ef_search = 64;
};

/**
 * Persistent table of (filename, chunk text, embedding, strategy, timestamp)
 * rows in SQLite, with a faiss HNSW index over the L2-normalized embeddings
 * (inner product == cosine similarity) stored in a file next to the database.
 * The index is keyed by row id and is the only thing query() searches.
 */
class VectorStore {
 public:
  static constexpr int MAX_ROWS_PER_STATEMENT = 200;

  VectorStore(DatabaseManager &db_manager, VectorStoreOptions options);
  ~VectorStore();

  // Disable copy constructor and assignment
  VectorStore(const VectorStore &) = delete;
  VectorStore &operator=(const VectorStore &) = delete;

  // Non-movable to keep DB references stable
  VectorStore(VectorStore &&) = delete;
  VectorStore &operator=(VectorStore &&) = delete;

  // Creates tables if needed, checks the declared dimension, loads or rebuilds the index.
  // Idempotent; call once per run before insert_batch() or query().
  void ensure_schema();

  // All rows in one transaction or none of them. Returns the number of rows written.
  size_t insert_batch(const std::vector<VectorRecord> &records);

  // Up to top_k rows by ascending cosine distance. top_k must be positive.
  std::vector<VectorStoreHit> query(const std::vector<float> &query_vector, int top_k);

  size_t count_records();
  size_t index_size() const;
  size_t dimension() const { return options_.dimension; }

  // Recreates the index from the table and persists it
  void rebuild_index();

 private:
  DatabaseManager &db_manager_;
  VectorStoreOptions options_;
  std::unique_ptr<faiss::IndexIDMap> index_;

  std::unique_ptr<faiss::IndexIDMap> create_base_index() const;
  faiss::IndexHNSW *hnsw_index() const;
  void load_or_rebuild_index(size_t row_count);
  void persist_index() const;
  void require_index(const char *operation) const;
  void validate_record(const VectorRecord &record, size_t position) const;

  static std::vector<char> to_blob(const std::vector<float> &vector);
  static std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str);
  static std::string int_vector_to_comma_string(const std::vector<int64_t> &vector);
};

}  // namespace docvec_core
