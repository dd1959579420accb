#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "docu_core/types/document.hpp"

namespace docu_core {

struct ChunkProvenance {
  std::string file_name;
  FileType file_type = FileType::Unknown;
  std::string file_path;
  int page_or_paragraph = 1;
  SectionKind section_kind = SectionKind::Page;
};

// A contiguous span of one section's text. Offsets and char_count are in code points.
struct Chunk {
  std::string text;
  int chunk_index = 0;
  size_t start_offset = 0;
  size_t end_offset = 0;
  int token_count = 0;
  size_t char_count = 0;
  ChunkProvenance provenance;
};

// A stored chunk returned for one query
struct RetrievedChunk : public Chunk {
  std::string id;
  float similarity_score = 0.0f;
  float distance = 0.0f;
};

// Flat scalar metadata written next to a chunk in the vector store
nlohmann::json to_metadata(const Chunk& chunk);

// Rebuilds a chunk from stored text and metadata; missing keys take defaults
Chunk chunk_from_metadata(const std::string& text, const nlohmann::json& metadata);

}  // namespace docu_core
