#pragma once

#include <string>
#include <vector>

namespace docvec_core {

using EmbeddingVector = std::vector<float>;

// A span of normalized source text produced at index time.
struct Chunk {
  std::string filename;
  std::string content;
  std::string split_strategy;
};

// A chunk paired with its document-intent embedding, ready to persist.
struct EmbeddedChunk {
  Chunk chunk;
  EmbeddingVector embedding;
};

}  // namespace docvec_core
