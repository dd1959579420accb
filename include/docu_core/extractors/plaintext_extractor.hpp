#pragma once

#include "content_extractor.hpp"

namespace docu_core {

// The whole file becomes page 1, even when it is empty
class PlainTextExtractor : public ContentExtractor {
 public:
  std::vector<std::string> extensions() const override {
    return {".txt"};
  }
  FileType get_file_type() const override {
    return FileType::Text;
  }

  ExtractedDocument extract(const fs::path& file_path) const override;
};

}  // namespace docu_core
