#pragma once

#include <string>
#include <vector>

namespace docu_core {

// Source file formats known to the pipeline. Only Text and Markdown have extractors.
enum class FileType { Text, Markdown, PDF, DOCX, Unknown };

// Whether a section number counts pages or paragraphs
enum class SectionKind { Page, Paragraph };

// Conversion utilities
std::string to_string(FileType type);
FileType file_type_from_string(const std::string& str);

std::string to_string(SectionKind kind);
SectionKind section_kind_from_string(const std::string& str);
// "Page" or "Paragraph", as shown to readers
std::string section_label(SectionKind kind);

struct DocumentSection {
  int number = 1;
  SectionKind kind = SectionKind::Page;
  std::string text;
  size_t char_count = 0;
  size_t word_count = 0;
};

// Output of a content extractor: one section per page or paragraph
struct ExtractedDocument {
  std::string file_name;
  FileType file_type = FileType::Unknown;
  std::string file_path;
  std::vector<DocumentSection> sections;

  int total_pages() const {
    return static_cast<int>(sections.size());
  }
};

}  // namespace docu_core
