#pragma once

#include <map>
#include <string>
#include <vector>

#include "docu_core/types/chunk.hpp"

namespace docu_core {

// Snapshot of the chunk a citation number points at
struct CitationSource {
  std::string file_name;
  int page_or_paragraph = 1;
  SectionKind section_kind = SectionKind::Page;
  std::string text;
  float similarity_score = 0.0f;
};

// Keyed by 1-based citation number; only numbers that resolve to a source appear
using CitationMap = std::map<int, CitationSource>;

struct CitationValidation {
  bool is_valid = true;
  std::vector<std::string> errors;
};

/**
 * @brief Parses [n] markers out of generated answers and resolves them.
 *
 * Numbering is positional against the chunk list that was shown to the
 * generator. Out-of-range numbers are reported by validate_citations and
 * left out of the map; nothing here throws on a bad citation.
 */
class CitationResolver {
 public:
  // Distinct citation numbers in ascending order. Numbers too large for int saturate to INT_MAX.
  std::vector<int> extract_citations(const std::string& text) const;

  CitationValidation validate_citations(const std::string& text, size_t num_sources) const;

  CitationMap map_citations_to_sources(const std::string& text,
                                       const std::vector<RetrievedChunk>& chunks) const;

  // "References:" followed by one line per entry, or "No citations found." for an empty map
  std::string format_references(const CitationMap& citation_map) const;
};

}  // namespace docu_core
