#include "docvec_core/services/indexing_service.hpp"

#include <iostream>

namespace docvec_core {

std::string to_string(IndexOutcome outcome) {
  switch (outcome) {
    case IndexOutcome::Indexed:
      return "INDEXED";
    case IndexOutcome::NothingToIndex:
      return "NOTHING_TO_INDEX";
    case IndexOutcome::NoDataPrepared:
      return "NO_DATA_PREPARED";
    default:
      return "UNKNOWN";
  }
}

std::string to_string(IndexingStage stage) {
  switch (stage) {
    case IndexingStage::Extracted:
      return "EXTRACTED";
    case IndexingStage::Chunked:
      return "CHUNKED";
    case IndexingStage::Embedded:
      return "EMBEDDED";
    case IndexingStage::Persisted:
      return "PERSISTED";
    case IndexingStage::Aborted:
      return "ABORTED";
    default:
      return "UNKNOWN";
  }
}

IndexingService::IndexingService(std::shared_ptr<VectorStore> vector_store,
                                 std::shared_ptr<EmbeddingProvider> embedding_provider,
                                 std::shared_ptr<ContentExtractorFactory> content_extractor_factory,
                                 SentenceChunker chunker)
    : vector_store_(std::move(vector_store)),
      embedding_provider_(std::move(embedding_provider)),
      content_extractor_factory_(std::move(content_extractor_factory)),
      chunker_(chunker) {}

IndexReport IndexingService::index_file(const std::filesystem::path &file_path) {
  if (!std::filesystem::exists(file_path)) {
    throw ContentExtractorError("The file was not found at: " + file_path.string());
  }
  const ContentExtractor &extractor = content_extractor_factory_->get_extractor_for(file_path);
  std::string text = extractor.extract_text(file_path);
  std::cout << "Extracted " << text.size() << " bytes of " << to_string(extractor.get_file_type())
            << " text from " << file_path.string() << std::endl;
  return index_text(file_path.filename().string(), text);
}

IndexReport IndexingService::index_text(const std::string &filename, const std::string &text) {
  IndexReport report;
  report.filename = filename;
  report.split_strategy = chunker_.strategy_name();
  report.stage = IndexingStage::Extracted;

  if (SentenceChunker::is_blank(text)) {
    std::cout << "No text content found in " << filename << "; nothing to index." << std::endl;
    return report;
  }

  std::vector<EmbeddedChunk> prepared;
  int chunk_number = 0;
  for (const std::string &raw_chunk : chunker_.chunk(text)) {
    ++chunk_number;
    ++report.chunks_total;
    report.stage = IndexingStage::Chunked;

    Chunk chunk{filename, SentenceChunker::normalize(raw_chunk), report.split_strategy};
    if (chunk.content.empty()) {
      std::cerr << "Warning: Skipping empty chunk " << chunk_number << " of " << filename
                << std::endl;
      ++report.chunks_skipped;
      continue;
    }

    try {
      EmbeddingVector embedding = embedding_provider_->embed(chunk.content, EmbeddingIntent::Document);
      prepared.push_back({std::move(chunk), std::move(embedding)});
    } catch (const EmbeddingError &e) {
      std::cerr << "Warning: Failed to embed chunk " << chunk_number << " of " << filename << ": "
                << e.what() << std::endl;
      ++report.chunks_failed;
      report.failures.push_back({chunk_number, e.what()});
    }
  }

  if (prepared.empty()) {
    if (report.chunks_failed > 0) {
      std::cerr << "Error: No data prepared for " << filename << ": all " << report.chunks_failed
                << " chunks failed to embed." << std::endl;
      report.outcome = IndexOutcome::NoDataPrepared;
      report.stage = IndexingStage::Aborted;
    } else {
      std::cout << "No non-empty chunks in " << filename << "; nothing to index." << std::endl;
    }
    return report;
  }
  report.stage = IndexingStage::Embedded;

  std::vector<VectorRecord> records;
  records.reserve(prepared.size());
  for (auto &embedded : prepared) {
    records.push_back({std::move(embedded.chunk.filename), std::move(embedded.chunk.content),
                       std::move(embedded.embedding), std::move(embedded.chunk.split_strategy)});
  }

  try {
    report.records_inserted = vector_store_->insert_batch(records);
  } catch (const VectorStoreError &e) {
    std::cerr << "Error: Failed to store chunks of " << filename << ": " << e.what() << std::endl;
    throw;
  }
  report.stage = IndexingStage::Persisted;
  report.outcome = IndexOutcome::Indexed;

  std::cout << "Indexed " << report.records_inserted << " chunks from " << filename << " ("
            << report.chunks_skipped << " skipped, " << report.chunks_failed << " failed)."
            << std::endl;
  return report;
}

}  // namespace docvec_core
