#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "docvec_core/chunking/sentence_chunker.hpp"

namespace docvec_core {

namespace {
std::string join(const std::vector<std::string>& parts) {
  std::string joined;
  for (const auto& part : parts) {
    if (!joined.empty())
      joined += ' ';
    joined += part;
  }
  return joined;
}
}  // namespace

TEST(SentenceChunkerTest, SevenSentencesMakeThreeChunksOfThree) {
  SentenceChunker chunker(3);
  auto chunks = chunker.chunk(docvec_tests::TestUtilities::seven_sentence_text()).to_vector();

  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0], "One is first. Two is second! Three is third?");
  EXPECT_EQ(chunks[1], "Four is fourth. Five is fifth. Six is sixth.");
  EXPECT_EQ(chunks[2], "Seven is last.");
}

TEST(SentenceChunkerTest, EmptyAndBlankInputYieldNoChunks) {
  SentenceChunker chunker(3);
  EXPECT_TRUE(chunker.chunk("").to_vector().empty());
  EXPECT_TRUE(chunker.chunk("   ").to_vector().empty());
  EXPECT_TRUE(chunker.chunk("\n\t \r\n").to_vector().empty());

  auto range = chunker.chunk("");
  EXPECT_TRUE(range.begin() == range.end());
}

TEST(SentenceChunkerTest, ChunksReconstructSentenceSequence) {
  const std::vector<std::string> inputs = {
      docvec_tests::TestUtilities::seven_sentence_text(),
      "No terminator at all",
      "Trailing spaces.   ",
      "  Leading spaces. Then more! And more? Yes.",
      "Version 2.5 is out. Dr. Smith said so.",
      "Line one.\nLine two.\r\nLine three.",
  };

  for (size_t n = 1; n <= 4; ++n) {
    SentenceChunker chunker(n);
    for (const auto& input : inputs) {
      auto sentences = SentenceChunker::split_sentences(input);
      auto chunks = chunker.chunk(input).to_vector();

      EXPECT_EQ(join(chunks), join(sentences)) << "input: " << input << " n=" << n;
      for (const auto& chunk : chunks) {
        EXPECT_LE(SentenceChunker::split_sentences(chunk).size(), n) << chunk;
      }
    }
  }
}

TEST(SentenceChunkerTest, AbbreviationsAndDecimalsAreNotSpecialCased) {
  auto sentences = SentenceChunker::split_sentences("Dr. Smith paid 2.5 dollars. Done.");
  ASSERT_EQ(sentences.size(), 3u);
  EXPECT_EQ(sentences[0], "Dr.");
  EXPECT_EQ(sentences[1], "Smith paid 2.5 dollars.");
  EXPECT_EQ(sentences[2], "Done.");
}

TEST(SentenceChunkerTest, FinalPartialGroupIsEmitted) {
  SentenceChunker chunker(2);
  auto chunks = chunker.chunk("A. B. C.").to_vector();
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[1], "C.");
}

TEST(SentenceChunkerTest, RangeIsLazyAndRestartable) {
  SentenceChunker chunker(3);
  auto range = chunker.chunk(docvec_tests::TestUtilities::seven_sentence_text());

  auto it = range.begin();
  ASSERT_TRUE(it != range.end());
  EXPECT_EQ(*it, "One is first. Two is second! Three is third?");

  std::vector<std::string> first_pass(range.begin(), range.end());
  std::vector<std::string> second_pass;
  for (const auto& chunk : range) {
    second_pass.push_back(chunk);
  }
  EXPECT_EQ(first_pass, second_pass);
  EXPECT_EQ(first_pass.size(), 3u);

  // The iterator taken before the full passes is unaffected by them
  ++it;
  EXPECT_EQ(*it, "Four is fourth. Five is fifth. Six is sixth.");
}

TEST(SentenceChunkerTest, UnicodeWhitespaceEndsSentences) {
  // U+00A0 no-break space and U+3000 ideographic space
  auto sentences = SentenceChunker::split_sentences("First.\xC2\xA0Second.\xE3\x80\x80Third.");
  ASSERT_EQ(sentences.size(), 3u);
  EXPECT_EQ(sentences[1], "Second.");
}

TEST(SentenceChunkerTest, InvalidUtf8IsReplaced) {
  auto chunks = SentenceChunker(1).chunk("Bad \xFF byte. Fine.").to_vector();
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], "Bad \xEF\xBF\xBD byte.");
}

TEST(SentenceChunkerTest, NormalizeCollapsesNewlinesAndTrims) {
  EXPECT_EQ(SentenceChunker::normalize("  line one\nline two\r\n "), "line one line two");
  EXPECT_EQ(SentenceChunker::normalize("\n\n"), "");
  EXPECT_TRUE(SentenceChunker::is_blank(" \t\n"));
  EXPECT_FALSE(SentenceChunker::is_blank(" x "));
}

TEST(SentenceChunkerTest, RejectsZeroSentencesPerChunk) {
  EXPECT_THROW(SentenceChunker(0), std::invalid_argument);
}

TEST(SentenceChunkerTest, ReportsStrategyName) {
  SentenceChunker chunker;
  EXPECT_EQ(chunker.strategy_name(), "sentence_split_simple");
  EXPECT_EQ(chunker.sentences_per_chunk(), 3u);
}

}  // namespace docvec_core
