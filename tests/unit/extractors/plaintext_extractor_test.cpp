#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "../../common/utilities_test.hpp"
#include "docvec_core/extractors/pdf_extractor.hpp"
#include "docvec_core/extractors/plaintext_extractor.hpp"

namespace docvec_core {

class PlainTextExtractorTest : public ::testing::Test {
 protected:
  void TearDown() override {
    if (!file_path_.empty()) {
      std::filesystem::remove_all(file_path_.parent_path());
    }
  }

  PlainTextExtractor extractor_;
  std::filesystem::path file_path_;
};

TEST_F(PlainTextExtractorTest, ReadsFileVerbatim) {
  const std::string content = "Hello world. This is a test.\nSecond line!";
  file_path_ = docvec_tests::TestUtilities::create_temp_file("hello.txt", content);
  EXPECT_EQ(extractor_.extract_text(file_path_), content);
}

TEST_F(PlainTextExtractorTest, ReplacesInvalidUtf8) {
  file_path_ = docvec_tests::TestUtilities::create_temp_file("bad.txt", "ok \xC3\x28 end");
  std::string text = extractor_.extract_text(file_path_);
  EXPECT_NE(text.find("\xEF\xBF\xBD"), std::string::npos);
  EXPECT_NE(text.find("end"), std::string::npos);
}

TEST_F(PlainTextExtractorTest, EmptyFileGivesEmptyText) {
  file_path_ = docvec_tests::TestUtilities::create_temp_file("empty.txt", "");
  EXPECT_EQ(extractor_.extract_text(file_path_), "");
}

TEST_F(PlainTextExtractorTest, MissingFileThrows) {
  EXPECT_THROW(extractor_.extract_text("/nonexistent/path/file.txt"), ContentExtractorError);
}

TEST_F(PlainTextExtractorTest, HandlesTextExtensions) {
  EXPECT_TRUE(extractor_.can_handle("a.txt"));
  EXPECT_TRUE(extractor_.can_handle("a.text"));
  EXPECT_FALSE(extractor_.can_handle("a.pdf"));
}

TEST(PdfExtractorTest, RejectsMissingAndInvalidFiles) {
  PdfExtractor extractor;
  EXPECT_TRUE(extractor.can_handle("paper.pdf"));
  EXPECT_THROW(extractor.extract_text("/nonexistent/path/paper.pdf"), ContentExtractorError);

  auto path = docvec_tests::TestUtilities::create_temp_file("broken.pdf", "not a pdf at all");
  EXPECT_THROW(extractor.extract_text(path), ContentExtractorError);
  std::filesystem::remove_all(path.parent_path());
}

}  // namespace docvec_core
