#include "docu_core/types.hpp"

namespace docu_core {

std::string to_string(FileType type) {
  switch (type) {
    case FileType::Text:
      return "txt";
    case FileType::Markdown:
      return "md";
    case FileType::PDF:
      return "pdf";
    case FileType::DOCX:
      return "docx";
    default:
      return "unknown";
  }
}

FileType file_type_from_string(const std::string& str) {
  if (str == "txt")
    return FileType::Text;
  if (str == "md")
    return FileType::Markdown;
  if (str == "pdf")
    return FileType::PDF;
  if (str == "docx")
    return FileType::DOCX;
  return FileType::Unknown;
}

std::string to_string(SectionKind kind) {
  switch (kind) {
    case SectionKind::Page:
      return "page";
    case SectionKind::Paragraph:
      return "paragraph";
  }
  return "page";
}

SectionKind section_kind_from_string(const std::string& str) {
  if (str == "paragraph")
    return SectionKind::Paragraph;
  return SectionKind::Page;
}

std::string section_label(SectionKind kind) {
  return kind == SectionKind::Paragraph ? "Paragraph" : "Page";
}

namespace {

long long read_integer(const nlohmann::json& metadata, const char* key, long long fallback) {
  auto it = metadata.find(key);
  if (it == metadata.end() || !it->is_number()) {
    return fallback;
  }
  return it->get<long long>();
}

std::string read_string(const nlohmann::json& metadata, const char* key) {
  auto it = metadata.find(key);
  if (it == metadata.end() || !it->is_string()) {
    return "";
  }
  return it->get<std::string>();
}

}  // namespace

nlohmann::json to_metadata(const Chunk& chunk) {
  return {
      {"file_name", chunk.provenance.file_name},
      {"file_type", to_string(chunk.provenance.file_type)},
      {"file_path", chunk.provenance.file_path},
      {"page_or_paragraph", chunk.provenance.page_or_paragraph},
      {"section_kind", to_string(chunk.provenance.section_kind)},
      {"chunk_index", chunk.chunk_index},
      {"start_offset", chunk.start_offset},
      {"end_offset", chunk.end_offset},
      {"token_count", chunk.token_count},
      {"char_count", chunk.char_count},
  };
}

Chunk chunk_from_metadata(const std::string& text, const nlohmann::json& metadata) {
  Chunk chunk;
  chunk.text = text;
  if (!metadata.is_object()) {
    return chunk;
  }
  chunk.chunk_index = static_cast<int>(read_integer(metadata, "chunk_index", 0));
  chunk.start_offset = static_cast<size_t>(read_integer(metadata, "start_offset", 0));
  chunk.end_offset = static_cast<size_t>(read_integer(metadata, "end_offset", 0));
  chunk.token_count = static_cast<int>(read_integer(metadata, "token_count", 0));
  chunk.char_count = static_cast<size_t>(read_integer(metadata, "char_count", 0));
  chunk.provenance.file_name = read_string(metadata, "file_name");
  chunk.provenance.file_type = file_type_from_string(read_string(metadata, "file_type"));
  chunk.provenance.file_path = read_string(metadata, "file_path");
  chunk.provenance.page_or_paragraph =
      static_cast<int>(read_integer(metadata, "page_or_paragraph", 1));
  chunk.provenance.section_kind = section_kind_from_string(read_string(metadata, "section_kind"));
  return chunk;
}

}  // namespace docu_core
