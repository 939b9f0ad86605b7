#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace docvec_core {

/**
 * @class ChunkRange
 * @brief Lazily evaluated sequence of sentence-group chunks over one text.
 *
 * The range owns a (UTF-8 sanitized) copy of the text. Chunks are computed
 * one at a time while iterating, and every call to begin() starts a fresh
 * scan, so the same range can be walked any number of times.
 */
class ChunkRange {
 public:
  class iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::string;
    using difference_type = std::ptrdiff_t;
    using pointer = const std::string*;
    using reference = const std::string&;

    // Default-constructed iterators compare equal to end()
    iterator() = default;

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }

    iterator& operator++();
    iterator operator++(int);

    bool operator==(const iterator& other) const;
    bool operator!=(const iterator& other) const { return !(*this == other); }

   private:
    friend class ChunkRange;
    iterator(std::shared_ptr<const std::string> text, size_t sentences_per_chunk);

    void load_next();

    std::shared_ptr<const std::string> text_;
    size_t sentences_per_chunk_ = 0;
    size_t position_ = 0;
    std::string current_;
    bool at_end_ = true;
  };

  ChunkRange(std::string text, size_t sentences_per_chunk);

  iterator begin() const;
  iterator end() const;

  // Materializes the whole sequence
  std::vector<std::string> to_vector() const;

 private:
  std::shared_ptr<const std::string> text_;
  size_t sentences_per_chunk_;
};

/**
 * @class SentenceChunker
 * @brief Splits text into groups of N sentence-like units.
 *
 * A sentence ends after '.', '!' or '?' when the next character is
 * whitespace. Abbreviations and decimal numbers are not special-cased.
 * Groups never overlap and the last group may be shorter than N.
 */
class SentenceChunker {
 public:
  static constexpr size_t DEFAULT_SENTENCES_PER_CHUNK = 3;
  static constexpr const char* STRATEGY_NAME = "sentence_split_simple";

  explicit SentenceChunker(size_t sentences_per_chunk = DEFAULT_SENTENCES_PER_CHUNK);

  ChunkRange chunk(std::string text) const;

  size_t sentences_per_chunk() const { return sentences_per_chunk_; }
  std::string strategy_name() const { return STRATEGY_NAME; }

  // Sentence units in order, trimmed, blank fragments removed
  static std::vector<std::string> split_sentences(const std::string& text);

  // Collapses CR/LF into spaces and trims surrounding whitespace
  static std::string normalize(std::string_view text);

  static bool is_blank(std::string_view text);

 private:
  size_t sentences_per_chunk_;
};

}  // namespace docvec_core
