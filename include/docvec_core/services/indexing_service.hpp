#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "docvec_core/chunking/sentence_chunker.hpp"
#include "docvec_core/db/vector_store.hpp"
#include "docvec_core/extractors/content_extractor_factory.hpp"
#include "docvec_core/llm/embedding_provider.hpp"
#include "docvec_core/types/chunk.hpp"

namespace docvec_core {

enum class IndexOutcome {
  Indexed,
  // Blank text, or every chunk normalized to nothing
  NothingToIndex,
  // There were chunks to embed but every embedding call failed; store untouched
  NoDataPrepared
};

enum class IndexingStage { Extracted, Chunked, Embedded, Persisted, Aborted };

std::string to_string(IndexOutcome outcome);
std::string to_string(IndexingStage stage);

struct ChunkFailure {
  int chunk_number;
  std::string message;
};

struct IndexReport {
  IndexOutcome outcome = IndexOutcome::NothingToIndex;
  IndexingStage stage = IndexingStage::Extracted;
  std::string filename;
  std::string split_strategy;
  size_t chunks_total = 0;
  size_t records_inserted = 0;
  size_t chunks_skipped = 0;
  size_t chunks_failed = 0;
  std::vector<ChunkFailure> failures;

  bool has_partial_failure() const { return chunks_failed > 0; }
};

class IndexingService {
 public:
  IndexingService(std::shared_ptr<VectorStore> vector_store,
                  std::shared_ptr<EmbeddingProvider> embedding_provider,
                  std::shared_ptr<ContentExtractorFactory> content_extractor_factory,
                  SentenceChunker chunker = SentenceChunker());

  // Extracts the file and indexes its text under the file's base name
  IndexReport index_file(const std::filesystem::path &file_path);

  // Chunk, embed (document intent) and bulk-insert already extracted text.
  // Chunks that fail to embed are dropped and counted; store errors propagate.
  IndexReport index_text(const std::string &filename, const std::string &text);

 private:
  std::shared_ptr<VectorStore> vector_store_;
  std::shared_ptr<EmbeddingProvider> embedding_provider_;
  std::shared_ptr<ContentExtractorFactory> content_extractor_factory_;
  SentenceChunker chunker_;
};

}  // namespace docvec_core
