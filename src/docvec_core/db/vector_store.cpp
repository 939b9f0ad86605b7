#include "docvec_core/db/vector_store.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/index_io.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include "docvec_core/db/pooled_connection.hpp"
#include "docvec_core/db/sqlite_error_utils.hpp"
#include "docvec_core/db/transaction.hpp"

namespace docvec_core {

namespace {
constexpr size_t REBUILD_BATCH_SIZE = 1024;
}

VectorStore::VectorStore(DatabaseManager &db_manager, VectorStoreOptions options)
    : db_manager_(db_manager), options_(std::move(options)) {
  if (options_.dimension == 0) {
    throw std::invalid_argument("VectorStore dimension must be greater than 0");
  }
  if (options_.index_path.empty()) {
    options_.index_path = db_manager_.db_path();
    options_.index_path += ".faiss";
  }
}

VectorStore::~VectorStore() = default;

void VectorStore::ensure_schema() {
  size_t row_count = 0;
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, Transaction::Locking::Immediate);

    *conn << "CREATE TABLE IF NOT EXISTS store_info (key TEXT PRIMARY KEY, value TEXT NOT NULL)";

    std::optional<std::string> declared_dimension;
    *conn << "SELECT value FROM store_info WHERE key = 'embedding_dimension'" >>
        [&](std::string value) { declared_dimension = value; };
    const std::string dimension_str = std::to_string(options_.dimension);
    if (declared_dimension && *declared_dimension != dimension_str) {
      throw VectorStoreError("Store declares " + *declared_dimension +
                             "-dimensional embeddings but " + dimension_str +
                             " were configured");
    }
    if (!declared_dimension) {
      *conn << "INSERT INTO store_info (key, value) VALUES ('embedding_dimension', ?)"
            << dimension_str;
    }
    *conn << "INSERT OR IGNORE INTO store_info (key, value) VALUES ('index_metric', 'cosine')";

    // Column width is enforced by the engine, not only by callers
    *conn << R"(
        CREATE TABLE IF NOT EXISTS documents (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            filename TEXT NOT NULL,
            chunk_text TEXT NOT NULL,
            embedding BLOB NOT NULL CHECK (length(embedding) = )" +
                 std::to_string(options_.dimension * sizeof(float)) + R"(),
            split_strategy TEXT,
            created_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP
        )
      )";
    *conn << "CREATE INDEX IF NOT EXISTS idx_documents_filename ON documents(filename)";

    int64_t count = 0;
    *conn << "SELECT COUNT(*) FROM documents" >> count;
    row_count = static_cast<size_t>(count);

    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreError(format_db_error("ensure_schema", e));
  }

  load_or_rebuild_index(row_count);
}

void VectorStore::load_or_rebuild_index(size_t row_count) {
  std::unique_ptr<faiss::IndexIDMap> loaded;
  if (std::filesystem::exists(options_.index_path)) {
    try {
      std::unique_ptr<faiss::Index> raw(faiss::read_index(options_.index_path.c_str()));
      auto *id_map = dynamic_cast<faiss::IndexIDMap *>(raw.get());
      if (id_map && static_cast<size_t>(id_map->d) == options_.dimension &&
          id_map->metric_type == faiss::METRIC_INNER_PRODUCT &&
          dynamic_cast<faiss::IndexHNSW *>(id_map->index) != nullptr) {
        raw.release();
        loaded.reset(id_map);
      } else {
        std::cerr << "Warning: Index file " << options_.index_path
                  << " does not match the store layout; rebuilding." << std::endl;
      }
    } catch (const faiss::FaissException &e) {
      std::cerr << "Warning: Could not read index file " << options_.index_path << " ("
                << e.what() << "); rebuilding." << std::endl;
    }
  }

  if (loaded && static_cast<size_t>(loaded->ntotal) == row_count) {
    index_ = std::move(loaded);
    return;
  }
  if (loaded) {
    std::cerr << "Warning: Index holds " << loaded->ntotal << " vectors but the table has "
              << row_count << " rows; rebuilding." << std::endl;
  }
  rebuild_index();
}

void VectorStore::rebuild_index() {
  auto index = create_base_index();
  const size_t dim = options_.dimension;

  std::vector<faiss::idx_t> batch_ids;
  std::vector<float> batch_vectors;
  batch_ids.reserve(REBUILD_BATCH_SIZE);
  batch_vectors.reserve(REBUILD_BATCH_SIZE * dim);

  auto flush = [&]() {
    if (batch_ids.empty())
      return;
    faiss::fvec_renorm_L2(dim, batch_ids.size(), batch_vectors.data());
    index->add_with_ids(static_cast<faiss::idx_t>(batch_ids.size()), batch_vectors.data(),
                        batch_ids.data());
    batch_ids.clear();
    batch_vectors.clear();
  };

  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, embedding FROM documents ORDER BY id" >>
        [&](int64_t id, std::vector<char> vector_blob) {
          if (vector_blob.size() != dim * sizeof(float)) {
            std::cerr << "Warning: Skipping row " << id
                      << " during index rebuild due to mismatched vector dimension." << std::endl;
            return;
          }
          const float *vec_ptr = reinterpret_cast<const float *>(vector_blob.data());
          batch_ids.push_back(id);
          batch_vectors.insert(batch_vectors.end(), vec_ptr, vec_ptr + dim);
          if (batch_ids.size() >= REBUILD_BATCH_SIZE) {
            flush();
          }
        };
    flush();
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreError(format_db_error("rebuild_index", e));
  } catch (const faiss::FaissException &e) {
    throw VectorStoreError("rebuild_index failed: " + std::string(e.what()));
  }

  index_ = std::move(index);
  try {
    persist_index();
  } catch (const std::exception &e) {
    throw VectorStoreError("Failed to write index file " + options_.index_path.string() + ": " +
                           e.what());
  }
}

size_t VectorStore::insert_batch(const std::vector<VectorRecord> &records) {
  if (records.empty()) {
    return 0;
  }
  require_index("insert_batch");
  for (size_t i = 0; i < records.size(); ++i) {
    validate_record(records[i], i);
  }

  const size_t dim = options_.dimension;
  std::vector<faiss::idx_t> new_ids;
  std::vector<float> new_vectors;
  new_ids.reserve(records.size());
  new_vectors.reserve(records.size() * dim);

  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, Transaction::Locking::Immediate);

    for (size_t start = 0; start < records.size(); start += MAX_ROWS_PER_STATEMENT) {
      const size_t end = std::min(records.size(), start + MAX_ROWS_PER_STATEMENT);

      std::string sql =
          "INSERT INTO documents (filename, chunk_text, embedding, split_strategy) VALUES ";
      for (size_t i = start; i < end; ++i) {
        sql += (i == start) ? "(?, ?, ?, ?)" : ", (?, ?, ?, ?)";
      }
      sql += " RETURNING id, embedding";

      auto insert = *conn << sql;
      for (size_t i = start; i < end; ++i) {
        const VectorRecord &record = records[i];
        std::optional<std::string> strategy;
        if (!record.split_strategy.empty())
          strategy = record.split_strategy;
        insert << record.filename << record.chunk_text << to_blob(record.embedding) << strategy;
      }
      insert >> [&](int64_t id, std::vector<char> vector_blob) {
        const float *vec_ptr = reinterpret_cast<const float *>(vector_blob.data());
        new_ids.push_back(id);
        new_vectors.insert(new_vectors.end(), vec_ptr, vec_ptr + dim);
      };
    }

    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreInsertError(format_db_error("insert_batch", e));
  }

  // Rows are committed; a stale index file is reconciled by the next ensure_schema()
  try {
    faiss::fvec_renorm_L2(dim, new_ids.size(), new_vectors.data());
    index_->add_with_ids(static_cast<faiss::idx_t>(new_ids.size()), new_vectors.data(),
                         new_ids.data());
    persist_index();
  } catch (const faiss::FaissException &e) {
    std::cerr << "Warning: Inserted " << new_ids.size()
              << " rows but failed to update the index: " << e.what() << std::endl;
  } catch (const std::filesystem::filesystem_error &e) {
    std::cerr << "Warning: Inserted " << new_ids.size()
              << " rows but failed to persist the index: " << e.what() << std::endl;
  }

  return new_ids.size();
}

std::vector<VectorStoreHit> VectorStore::query(const std::vector<float> &query_vector, int top_k) {
  if (top_k <= 0) {
    throw std::invalid_argument("top_k must be a positive integer, got " + std::to_string(top_k));
  }
  if (query_vector.size() != options_.dimension) {
    throw VectorStoreError("Query vector dimension mismatch. Expected " +
                           std::to_string(options_.dimension) + ", got " +
                           std::to_string(query_vector.size()));
  }
  require_index("query");
  if (index_->ntotal == 0) {
    return {};
  }

  std::vector<float> normalized(query_vector);
  const float norm_sqr = faiss::fvec_norm_L2sqr(normalized.data(), options_.dimension);
  if (!std::isfinite(norm_sqr) || norm_sqr <= 0.0f) {
    throw VectorStoreError("Query vector has zero or non-finite magnitude");
  }
  faiss::fvec_renorm_L2(options_.dimension, 1, normalized.data());

  const int k = static_cast<int>(std::min<faiss::idx_t>(top_k, index_->ntotal));
  hnsw_index()->hnsw.efSearch = std::max(options_.hnsw_ef_search, k);

  std::vector<float> scores(k);
  std::vector<faiss::idx_t> labels(k);
  try {
    index_->search(1, normalized.data(), k, scores.data(), labels.data());
  } catch (const faiss::FaissException &e) {
    throw VectorStoreError("Index search failed: " + std::string(e.what()));
  }

  std::vector<int64_t> label_ids;
  label_ids.reserve(k);
  for (int i = 0; i < k; ++i) {
    if (labels[i] != -1) {
      label_ids.push_back(labels[i]);
    }
  }
  if (label_ids.empty()) {
    return {};
  }

  // Fetch all matched rows in one query
  std::unordered_map<int64_t, VectorStoreHit> id_to_row;
  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, filename, chunk_text, split_strategy, created_at FROM documents "
             "WHERE id IN (" + int_vector_to_comma_string(label_ids) + ")" >>
        [&](int64_t id, std::string filename, std::string chunk_text,
            std::optional<std::string> split_strategy, std::string created_at) {
          VectorStoreHit hit;
          hit.id = id;
          hit.filename = std::move(filename);
          hit.chunk_text = std::move(chunk_text);
          if (split_strategy)
            hit.split_strategy = *split_strategy;
          hit.created_at = string_to_time_point(created_at);
          id_to_row[id] = std::move(hit);
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreError(format_db_error("query", e));
  }

  // Assemble results in the same order as the labels/scores
  std::vector<VectorStoreHit> results;
  results.reserve(label_ids.size());
  for (int i = 0; i < k; ++i) {
    if (labels[i] == -1)
      continue;
    auto it = id_to_row.find(labels[i]);
    if (it == id_to_row.end()) {
      std::cerr << "Warning: Index returned ID " << labels[i]
                << " but no corresponding row found in the table." << std::endl;
      continue;
    }
    VectorStoreHit hit = std::move(it->second);
    hit.distance = 1.0f - scores[i];
    hit.similarity = std::clamp(scores[i], 0.0f, 1.0f);
    results.push_back(std::move(hit));
  }
  return results;
}

size_t VectorStore::count_records() {
  try {
    PooledConnection conn(db_manager_);
    int64_t count = 0;
    *conn << "SELECT COUNT(*) FROM documents" >> count;
    return static_cast<size_t>(count);
  } catch (const sqlite::sqlite_exception &e) {
    throw VectorStoreError(format_db_error("count_records", e));
  }
}

size_t VectorStore::index_size() const {
  return index_ ? static_cast<size_t>(index_->ntotal) : 0;
}

std::unique_ptr<faiss::IndexIDMap> VectorStore::create_base_index() const {
  auto base_index = std::make_unique<faiss::IndexHNSWFlat>(
      static_cast<int>(options_.dimension), options_.hnsw_m, faiss::METRIC_INNER_PRODUCT);
  base_index->hnsw.efConstruction = options_.hnsw_ef_construction;
  base_index->hnsw.efSearch = options_.hnsw_ef_search;
  // Wrap with IDMap to enable add_with_ids; the map owns the HNSW index
  auto id_map = std::make_unique<faiss::IndexIDMap>(base_index.release());
  id_map->own_fields = true;
  return id_map;
}

faiss::IndexHNSW *VectorStore::hnsw_index() const {
  auto *hnsw = dynamic_cast<faiss::IndexHNSW *>(index_->index);
  if (!hnsw) {
    throw VectorStoreError("Index is not an HNSW index");
  }
  return hnsw;
}

void VectorStore::persist_index() const {
  std::filesystem::path tmp_path = options_.index_path;
  tmp_path += ".tmp";
  if (options_.index_path.has_parent_path()) {
    std::filesystem::create_directories(options_.index_path.parent_path());
  }
  faiss::write_index(index_.get(), tmp_path.c_str());
  std::filesystem::rename(tmp_path, options_.index_path);
}

void VectorStore::require_index(const char *operation) const {
  if (!index_) {
    throw VectorStoreError(std::string("ensure_schema() must run before ") + operation + "()");
  }
}

void VectorStore::validate_record(const VectorRecord &record, size_t position) const {
  const std::string where =
      "Record " + std::to_string(position) + " (" + record.filename + "): ";
  if (record.filename.empty()) {
    throw VectorStoreInsertError(where + "filename is required");
  }
  if (record.chunk_text.empty()) {
    throw VectorStoreInsertError(where + "chunk_text is required");
  }
  if (record.embedding.size() != options_.dimension) {
    throw VectorStoreInsertError(where + "vector dimension mismatch. Expected " +
                                 std::to_string(options_.dimension) + ", got " +
                                 std::to_string(record.embedding.size()));
  }
  float norm_sqr = 0.0f;
  for (float value : record.embedding) {
    if (!std::isfinite(value)) {
      throw VectorStoreInsertError(where + "embedding contains a non-finite value");
    }
    norm_sqr += value * value;
  }
  if (norm_sqr <= 0.0f) {
    throw VectorStoreInsertError(where + "embedding has zero magnitude");
  }
}

std::vector<char> VectorStore::to_blob(const std::vector<float> &vector) {
  std::vector<char> vector_blob(vector.size() * sizeof(float));
  std::memcpy(vector_blob.data(), vector.data(), vector_blob.size());
  return vector_blob;
}

std::chrono::system_clock::time_point VectorStore::string_to_time_point(
    const std::string &time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw VectorStoreError("Failed to parse time string: " + time_str +
                           ". Expected format YYYY-MM-DD HH:MM:SS.");
  }
  // CURRENT_TIMESTAMP is UTC
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

std::string VectorStore::int_vector_to_comma_string(const std::vector<int64_t> &vector) {
  std::stringstream ss;
  for (size_t i = 0; i < vector.size(); ++i) {
    ss << vector[i];
    if (i < vector.size() - 1)
      ss << ",";
  }
  return ss.str();
}

}  // namespace docvec_core
