#pragma once

#include "content_extractor.hpp"

namespace docu_core {

/**
 * @brief Splits Markdown on ATX headings ("# ", "## ", ...).
 *
 * Each heading starts a new paragraph section that runs to the next heading;
 * text before the first heading is a section of its own. Sections are
 * numbered from 1 after empty blocks are dropped.
 */
class MarkdownExtractor : public ContentExtractor {
 public:
  std::vector<std::string> extensions() const override {
    return {".md", ".markdown"};
  }
  FileType get_file_type() const override {
    return FileType::Markdown;
  }

  ExtractedDocument extract(const fs::path& file_path) const override;

 private:
  std::vector<DocumentSection> split_on_headings(const std::string& content) const;
};

}  // namespace docu_core
