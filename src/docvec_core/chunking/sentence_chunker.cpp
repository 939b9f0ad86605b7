#include "docvec_core/chunking/sentence_chunker.hpp"

#include <utf8.h>

#include <cstdint>
#include <iterator>
#include <optional>
#include <utility>
#include <stdexcept>

namespace docvec_core {

namespace {

// Same set a "\s" character class matches for Unicode text
bool is_unicode_space(uint32_t cp) {
  if (cp == ' ' || (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x1F))
    return true;
  switch (cp) {
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200A;
  }
}

bool is_terminator(uint32_t cp) {
  return cp == '.' || cp == '!' || cp == '?';
}

std::string sanitize_utf8(std::string text) {
  if (utf8::is_valid(text.begin(), text.end())) {
    return text;
  }
  std::string cleaned;
  cleaned.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(cleaned));
  return cleaned;
}

std::string_view trim_view(std::string_view text) {
  auto it = text.begin();
  const auto end = text.end();
  size_t first = text.size();
  size_t last = 0;
  while (it != end) {
    size_t offset = static_cast<size_t>(it - text.begin());
    uint32_t cp = utf8::next(it, end);
    if (!is_unicode_space(cp)) {
      if (first == text.size())
        first = offset;
      last = static_cast<size_t>(it - text.begin());
    }
  }
  if (first == text.size())
    return {};
  return text.substr(first, last - first);
}

// Returns the next non-blank sentence at or after `pos` and moves `pos` past
// the whitespace run that terminated it.
std::optional<std::string_view> next_sentence(const std::string& text, size_t& pos) {
  const std::string_view view(text);
  while (pos < text.size()) {
    const size_t start = pos;
    auto it = text.begin() + static_cast<std::ptrdiff_t>(pos);
    const auto end = text.end();
    bool after_terminator = false;
    size_t fragment_end = text.size();
    size_t resume = text.size();

    while (it != end) {
      const size_t offset = static_cast<size_t>(it - text.begin());
      uint32_t cp = utf8::next(it, end);
      if (after_terminator && is_unicode_space(cp)) {
        fragment_end = offset;
        // Swallow the whole whitespace run
        resume = static_cast<size_t>(it - text.begin());
        while (it != end) {
          auto probe = it;
          if (!is_unicode_space(utf8::next(probe, end)))
            break;
          it = probe;
          resume = static_cast<size_t>(it - text.begin());
        }
        break;
      }
      after_terminator = is_terminator(cp);
    }

    pos = resume;
    std::string_view sentence = trim_view(view.substr(start, fragment_end - start));
    if (!sentence.empty())
      return sentence;
  }
  return std::nullopt;
}

}  // namespace

ChunkRange::iterator::iterator(std::shared_ptr<const std::string> text,
                               size_t sentences_per_chunk)
    : text_(std::move(text)), sentences_per_chunk_(sentences_per_chunk), at_end_(false) {
  load_next();
}

void ChunkRange::iterator::load_next() {
  current_.clear();
  size_t gathered = 0;
  while (gathered < sentences_per_chunk_) {
    auto sentence = next_sentence(*text_, position_);
    if (!sentence)
      break;
    if (gathered > 0)
      current_ += ' ';
    current_.append(sentence->data(), sentence->size());
    ++gathered;
  }
  if (gathered == 0) {
    at_end_ = true;
    text_.reset();
    position_ = 0;
  }
}

ChunkRange::iterator& ChunkRange::iterator::operator++() {
  if (!at_end_)
    load_next();
  return *this;
}

ChunkRange::iterator ChunkRange::iterator::operator++(int) {
  iterator previous = *this;
  ++(*this);
  return previous;
}

bool ChunkRange::iterator::operator==(const iterator& other) const {
  if (at_end_ || other.at_end_)
    return at_end_ == other.at_end_;
  return text_ == other.text_ && position_ == other.position_;
}

ChunkRange::ChunkRange(std::string text, size_t sentences_per_chunk)
    : text_(std::make_shared<const std::string>(sanitize_utf8(std::move(text)))),
      sentences_per_chunk_(sentences_per_chunk) {}

ChunkRange::iterator ChunkRange::begin() const {
  return iterator(text_, sentences_per_chunk_);
}

ChunkRange::iterator ChunkRange::end() const {
  return iterator();
}

std::vector<std::string> ChunkRange::to_vector() const {
  return std::vector<std::string>(begin(), end());
}

SentenceChunker::SentenceChunker(size_t sentences_per_chunk)
    : sentences_per_chunk_(sentences_per_chunk) {
  if (sentences_per_chunk_ == 0) {
    throw std::invalid_argument("sentences_per_chunk must be at least 1");
  }
}

ChunkRange SentenceChunker::chunk(std::string text) const {
  return ChunkRange(std::move(text), sentences_per_chunk_);
}

std::vector<std::string> SentenceChunker::split_sentences(const std::string& text) {
  const std::string clean = sanitize_utf8(text);
  std::vector<std::string> sentences;
  size_t pos = 0;
  while (auto sentence = next_sentence(clean, pos)) {
    sentences.emplace_back(*sentence);
  }
  return sentences;
}

std::string SentenceChunker::normalize(std::string_view text) {
  std::string flattened = sanitize_utf8(std::string(text));
  for (char& c : flattened) {
    if (c == '\n' || c == '\r')
      c = ' ';
  }
  return std::string(trim_view(flattened));
}

bool SentenceChunker::is_blank(std::string_view text) {
  return normalize(text).empty();
}

}  // namespace docvec_core
