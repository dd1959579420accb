#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "docu_core/types/document.hpp"

namespace fs = std::filesystem;

namespace docu_core {

class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  // Lowercase extensions including the dot, e.g. ".md"
  virtual std::vector<std::string> extensions() const = 0;

  // True when the file's extension, compared case-insensitively, is one of extensions()
  virtual bool can_handle(const fs::path& file_path) const;

  // Reads the file and splits it into pages or paragraphs. Throws DocumentProcessingError.
  virtual ExtractedDocument extract(const fs::path& file_path) const = 0;

  virtual FileType get_file_type() const = 0;

  // Collapses whitespace runs to one space and strips both ends
  static std::string clean_text(const std::string& text);

 protected:
  // Reads the whole file; invalid UTF-8 is reinterpreted as Latin-1
  std::string get_string_content(const fs::path& file_path) const;
  static std::string ensure_utf8(const std::string& raw);

  static DocumentSection make_section(int number, SectionKind kind, const std::string& text);
  ExtractedDocument make_document(const fs::path& file_path,
                                  std::vector<DocumentSection> sections) const;
};

// Define a type for our smart pointers
using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace docu_core
