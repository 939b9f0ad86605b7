#include "docvec_core/extractors/docx_extractor.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <zip.h>

#include <cstring>
#include <memory>
#include <utility>
#include <vector>

namespace docvec_core {

namespace {

constexpr const char* kDocumentEntry = "word/document.xml";
constexpr const char* kWordNamespace = "http://schemas.openxmlformats.org/wordprocessingml/2006/main";

struct ZipArchiveCloser {
  void operator()(zip_t* archive) const { zip_discard(archive); }
};
struct ZipFileCloser {
  void operator()(zip_file_t* file) const { zip_fclose(file); }
};
struct XmlDocFreer {
  void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

bool is_word_element(const xmlNode* node, const char* local_name) {
  return node->type == XML_ELEMENT_NODE && node->ns != nullptr &&
         std::strcmp(reinterpret_cast<const char*>(node->ns->href), kWordNamespace) == 0 &&
         std::strcmp(reinterpret_cast<const char*>(node->name), local_name) == 0;
}

void append_run_text(const xmlNode* node, std::string& out) {
  for (const xmlNode* child = node->children; child != nullptr; child = child->next) {
    if (child->type != XML_ELEMENT_NODE) {
      continue;
    }
    if (is_word_element(child, "t")) {
      xmlChar* content = xmlNodeGetContent(child);
      if (content) {
        out += reinterpret_cast<const char*>(content);
        xmlFree(content);
      }
    } else if (is_word_element(child, "tab")) {
      out += '\t';
    } else if (is_word_element(child, "br") || is_word_element(child, "cr")) {
      out += '\n';
    } else if (!is_word_element(child, "pPr") && !is_word_element(child, "rPr")) {
      // Runs nest inside hyperlinks, insertions and smart tags
      append_run_text(child, out);
    }
  }
}

std::string read_document_entry(const fs::path& file_path) {
  int error_code = 0;
  std::unique_ptr<zip_t, ZipArchiveCloser> archive(
      zip_open(file_path.c_str(), ZIP_RDONLY, &error_code));
  if (!archive) {
    zip_error_t error;
    zip_error_init_with_code(&error, error_code);
    std::string reason = zip_error_strerror(&error);
    zip_error_fini(&error);
    throw ContentExtractorError("Failed to open DOCX archive " + file_path.string() + ": " +
                                reason);
  }

  zip_stat_t stat;
  zip_stat_init(&stat);
  if (zip_stat(archive.get(), kDocumentEntry, 0, &stat) != 0 || !(stat.valid & ZIP_STAT_SIZE)) {
    throw ContentExtractorError("DOCX archive has no " + std::string(kDocumentEntry) + ": " +
                                file_path.string());
  }

  std::unique_ptr<zip_file_t, ZipFileCloser> entry(zip_fopen(archive.get(), kDocumentEntry, 0));
  if (!entry) {
    throw ContentExtractorError("Failed to read " + std::string(kDocumentEntry) + " from " +
                                file_path.string() + ": " + zip_strerror(archive.get()));
  }

  std::string xml(static_cast<size_t>(stat.size), '\0');
  zip_int64_t read = zip_fread(entry.get(), xml.data(), stat.size);
  if (read < 0 || static_cast<zip_uint64_t>(read) != stat.size) {
    throw ContentExtractorError("Truncated " + std::string(kDocumentEntry) + " in " +
                                file_path.string());
  }
  return xml;
}

}  // namespace

bool DocxExtractor::can_handle(const fs::path& file_path) const {
  return file_type_from_extension(file_path) == FileType::DOCX;
}

std::string DocxExtractor::extract_text(const fs::path& file_path) const {
  if (!fs::exists(file_path)) {
    throw ContentExtractorError("The file was not found at: " + file_path.string());
  }
  return paragraphs_from_xml(read_document_entry(file_path));
}

std::string DocxExtractor::paragraphs_from_xml(const std::string& document_xml) {
  std::unique_ptr<xmlDoc, XmlDocFreer> doc(
      xmlReadMemory(document_xml.data(), static_cast<int>(document_xml.size()), kDocumentEntry,
                    nullptr, XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
  if (!doc) {
    throw ContentExtractorError("word/document.xml is not well-formed XML");
  }

  const xmlNode* root = xmlDocGetRootElement(doc.get());
  if (root == nullptr || !is_word_element(root, "document")) {
    throw ContentExtractorError("word/document.xml has no w:document root");
  }

  std::vector<std::string> paragraphs;
  for (const xmlNode* body = root->children; body != nullptr; body = body->next) {
    if (!is_word_element(body, "body")) {
      continue;
    }
    for (const xmlNode* node = body->children; node != nullptr; node = node->next) {
      if (is_word_element(node, "p")) {
        std::string paragraph;
        append_run_text(node, paragraph);
        paragraphs.push_back(std::move(paragraph));
      }
    }
  }

  std::string text;
  for (size_t i = 0; i < paragraphs.size(); ++i) {
    if (i > 0) {
      text += '\n';
    }
    text += paragraphs[i];
  }
  return sanitize_utf8(text);
}

}  // namespace docvec_core
