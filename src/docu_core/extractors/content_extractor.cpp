#include "docu_core/extractors/content_extractor.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <sstream>

#include "docu_core/errors.hpp"
#include "docu_core/util/text.hpp"

namespace docu_core {

bool ContentExtractor::can_handle(const fs::path& file_path) const {
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  const auto supported = extensions();
  return !extension.empty() &&
         std::find(supported.begin(), supported.end(), extension) != supported.end();
}

std::string ContentExtractor::get_string_content(const fs::path& file_path) const {
  if (!fs::exists(file_path)) {
    throw DocumentProcessingError("File not found: " + file_path.string());
  }

  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw DocumentProcessingError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  return ensure_utf8(buffer.str());
}

std::string ContentExtractor::ensure_utf8(const std::string& raw) {
  if (utf8::is_valid(raw.begin(), raw.end())) {
    return raw;
  }

  // Every byte is a Latin-1 code point
  std::string converted;
  converted.reserve(raw.size() * 2);
  for (unsigned char byte : raw) {
    utf8::append(static_cast<uint32_t>(byte), std::back_inserter(converted));
  }
  return converted;
}

std::string ContentExtractor::clean_text(const std::string& text) {
  std::string cleaned;
  cleaned.reserve(text.size());
  bool pending_space = false;
  for (char c : text) {
    if (is_ascii_space(c)) {
      pending_space = !cleaned.empty();
      continue;
    }
    if (pending_space) {
      cleaned += ' ';
      pending_space = false;
    }
    cleaned += c;
  }
  return cleaned;
}

DocumentSection ContentExtractor::make_section(int number,
                                               SectionKind kind,
                                               const std::string& text) {
  DocumentSection section;
  section.number = number;
  section.kind = kind;
  section.text = text;
  section.char_count = utf8_length(text);
  section.word_count = count_words(text);
  return section;
}

ExtractedDocument ContentExtractor::make_document(const fs::path& file_path,
                                                  std::vector<DocumentSection> sections) const {
  ExtractedDocument document;
  document.file_name = file_path.filename().string();
  document.file_type = get_file_type();
  document.file_path = file_path.string();
  document.sections = std::move(sections);
  return document;
}

}  // namespace docu_core
