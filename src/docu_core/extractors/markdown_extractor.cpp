#include "docu_core/extractors/markdown_extractor.hpp"

#include <spdlog/spdlog.h>

#include <regex>

namespace docu_core {
ExtractedDocument MarkdownExtractor::extract(const std::filesystem::path& file_path) const {
  std::string content = get_string_content(file_path);
  std::vector<DocumentSection> sections = split_on_headings(content);
  spdlog::debug("Extracted {} sections from {}", sections.size(), file_path.filename().string());
  return make_document(file_path, std::move(sections));
}

std::vector<DocumentSection> MarkdownExtractor::split_on_headings(
    const std::string& content) const {
  if (content.empty()) {
    return {};
  }

  const std::regex heading_regex(
      R"(^#+\s.*)", std::regex_constants::ECMAScript | std::regex_constants::multiline);

  std::vector<long> split_points;
  split_points.push_back(0);

  auto headings_begin = std::sregex_iterator(content.begin(), content.end(), heading_regex);
  auto headings_end = std::sregex_iterator();

  for (std::sregex_iterator i = headings_begin; i != headings_end; ++i) {
    split_points.push_back(i->position());
  }
  split_points.push_back(static_cast<long>(content.length()));

  std::vector<DocumentSection> sections;
  int paragraph_number = 1;

  for (size_t i = 0; i < split_points.size() - 1; ++i) {
    long start = split_points[i];
    long length = split_points[i + 1] - start;
    if (length == 0)
      continue;

    std::string text = clean_text(content.substr(start, length));
    if (text.empty())
      continue;

    sections.push_back(make_section(paragraph_number++, SectionKind::Paragraph, text));
  }

  return sections;
}
}  // namespace docu_core
