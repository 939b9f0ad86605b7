#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "docvec_core/db/database_manager.hpp"
#include "docvec_core/db/pooled_connection.hpp"
#include "docvec_core/db/vector_store.hpp"

namespace docvec_tests {

constexpr size_t TEST_DIMENSION = 8;
constexpr const char *TEST_DB_KEY = "docvec_test_key";

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Database utilities
  static std::filesystem::path create_temp_test_db();
  static void cleanup_temp_db(const std::filesystem::path& db_path);

  // Writes a file into a fresh temp directory and returns its path
  static std::filesystem::path create_temp_file(const std::string& filename,
                                                const std::string& contents);

  // Writes a minimal .docx archive holding the given word/document.xml
  static std::filesystem::path create_temp_docx(const std::string& filename,
                                                const std::string& document_xml);

  // Wraps paragraph texts in a WordprocessingML document body
  static std::string word_document_xml(const std::vector<std::string>& paragraphs);

  // Deterministic, non-zero vector derived from the seed text
  static std::vector<float> create_test_vector(const std::string& seed_text,
                                               size_t dimension = TEST_DIMENSION);

  static std::vector<docvec_core::VectorRecord> create_test_records(
      int count, const std::string& filename = "test.txt", size_t dimension = TEST_DIMENSION);

  // Seven short sentences S1..S7
  static std::string seven_sentence_text();
};

/**
 * Base test fixture that provides a keyed temporary store and a VectorStore over it
 */
class VectorStoreTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_db_path_ = TestUtilities::create_temp_test_db();
    db_manager_ = std::make_unique<docvec_core::DatabaseManager>(temp_db_path_, TEST_DB_KEY);
    vector_store_ = make_store();
    vector_store_->ensure_schema();
  }

  void TearDown() override {
    vector_store_.reset();
    db_manager_.reset();
    TestUtilities::cleanup_temp_db(temp_db_path_);
  }

  std::shared_ptr<docvec_core::VectorStore> make_store(size_t dimension = TEST_DIMENSION) {
    docvec_core::VectorStoreOptions options;
    options.dimension = dimension;
    options.hnsw_m = 16;
    options.hnsw_ef_construction = 64;
    options.hnsw_ef_search = 32;
    return std::make_shared<docvec_core::VectorStore>(*db_manager_, options);
  }

  int64_t count_rows() {
    docvec_core::PooledConnection conn(*db_manager_);
    int64_t count = 0;
    *conn << "SELECT COUNT(*) FROM documents" >> count;
    return count;
  }

  std::filesystem::path index_path() const {
    std::filesystem::path path = temp_db_path_;
    path += ".faiss";
    return path;
  }

  std::filesystem::path temp_db_path_;
  std::unique_ptr<docvec_core::DatabaseManager> db_manager_;
  std::shared_ptr<docvec_core::VectorStore> vector_store_;
};

}  // namespace docvec_tests
