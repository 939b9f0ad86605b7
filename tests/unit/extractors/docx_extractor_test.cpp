#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "../../common/utilities_test.hpp"
#include "docvec_core/extractors/docx_extractor.hpp"

namespace docvec_core {

class DocxExtractorTest : public ::testing::Test {
 protected:
  void TearDown() override {
    if (!file_path_.empty()) {
      std::filesystem::remove_all(file_path_.parent_path());
    }
  }

  DocxExtractor extractor_;
  std::filesystem::path file_path_;
};

TEST_F(DocxExtractorTest, JoinsParagraphsWithNewlines) {
  file_path_ = docvec_tests::TestUtilities::create_temp_docx(
      "letter.docx", docvec_tests::TestUtilities::word_document_xml(
                         {"Dear reader.", "This is the body. It has two sentences.", "Regards"}));

  EXPECT_EQ(extractor_.extract_text(file_path_),
            "Dear reader.\nThis is the body. It has two sentences.\nRegards");
}

TEST_F(DocxExtractorTest, EmptyParagraphsKeepTheirLine) {
  file_path_ = docvec_tests::TestUtilities::create_temp_docx(
      "gaps.docx", docvec_tests::TestUtilities::word_document_xml({"First.", "", "Third."}));
  EXPECT_EQ(extractor_.extract_text(file_path_), "First.\n\nThird.");
}

TEST_F(DocxExtractorTest, ConcatenatesRunsAndNestedRuns) {
  const std::string xml =
      R"(<?xml version="1.0" encoding="UTF-8"?>)"
      R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
      R"(<w:body><w:p><w:pPr><w:pStyle w:val="Title"/></w:pPr>)"
      R"(<w:r><w:rPr><w:b/></w:rPr><w:t>Bold</w:t></w:r>)"
      R"(<w:r><w:t xml:space="preserve"> and </w:t></w:r>)"
      R"(<w:hyperlink><w:r><w:t>linked</w:t></w:r></w:hyperlink>)"
      R"(<w:r><w:tab/><w:t>tabbed</w:t><w:br/><w:t>broken</w:t></w:r></w:p>)"
      R"(<w:tbl><w:tr><w:tc><w:p><w:r><w:t>cell</w:t></w:r></w:p></w:tc></w:tr></w:tbl>)"
      R"(</w:body></w:document>)";

  EXPECT_EQ(DocxExtractor::paragraphs_from_xml(xml), "Bold and linked\ttabbed\nbroken");
}

TEST_F(DocxExtractorTest, HandlesDocxExtensionOnly) {
  EXPECT_TRUE(extractor_.can_handle("letter.docx"));
  EXPECT_TRUE(extractor_.can_handle("LETTER.DOCX"));
  EXPECT_FALSE(extractor_.can_handle("letter.doc"));
  EXPECT_EQ(extractor_.get_file_type(), FileType::DOCX);
}

TEST_F(DocxExtractorTest, RejectsMissingAndCorruptFiles) {
  EXPECT_THROW(extractor_.extract_text("/nonexistent/path/letter.docx"), ContentExtractorError);

  file_path_ = docvec_tests::TestUtilities::create_temp_file("broken.docx", "not a zip archive");
  EXPECT_THROW(extractor_.extract_text(file_path_), ContentExtractorError);
}

TEST_F(DocxExtractorTest, RejectsMalformedDocumentXml) {
  file_path_ = docvec_tests::TestUtilities::create_temp_docx("bad.docx", "<w:document><w:body>");
  EXPECT_THROW(extractor_.extract_text(file_path_), ContentExtractorError);

  EXPECT_THROW(DocxExtractor::paragraphs_from_xml("<html><body/></html>"), ContentExtractorError);
}

}  // namespace docvec_core
