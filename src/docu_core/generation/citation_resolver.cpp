#include "docu_core/generation/citation_resolver.hpp"

#include <spdlog/fmt/fmt.h>

#include <climits>
#include <regex>
#include <set>

#include "docu_core/util/text.hpp"

namespace docu_core {

namespace {

int parse_saturating(const std::string& digits) {
  long long value = 0;
  for (const char c : digits) {
    value = value * 10 + (c - '0');
    if (value > INT_MAX) {
      return INT_MAX;
    }
  }
  return static_cast<int>(value);
}

bool in_range(int citation, size_t num_sources) {
  return citation >= 1 && static_cast<size_t>(citation) <= num_sources;
}

}  // namespace

std::vector<int> CitationResolver::extract_citations(const std::string& text) const {
  static const std::regex citation_regex(R"(\[(\d+)\])");

  std::set<int> citations;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), citation_regex);
       it != std::sregex_iterator(); ++it) {
    citations.insert(parse_saturating((*it)[1].str()));
  }
  return {citations.begin(), citations.end()};
}

CitationValidation CitationResolver::validate_citations(const std::string& text,
                                                        size_t num_sources) const {
  CitationValidation validation;
  for (const int citation : extract_citations(text)) {
    if (!in_range(citation, num_sources)) {
      validation.errors.push_back("Invalid citation [" + std::to_string(citation) + "]: only " +
                                  std::to_string(num_sources) + " sources available");
    }
  }
  validation.is_valid = validation.errors.empty();
  return validation;
}

CitationMap CitationResolver::map_citations_to_sources(
    const std::string& text, const std::vector<RetrievedChunk>& chunks) const {
  CitationMap citation_map;
  for (const int citation : extract_citations(text)) {
    if (!in_range(citation, chunks.size())) {
      continue;
    }
    const auto& chunk = chunks[static_cast<size_t>(citation - 1)];
    citation_map[citation] = CitationSource{chunk.provenance.file_name,
                                            chunk.provenance.page_or_paragraph,
                                            chunk.provenance.section_kind,
                                            chunk.text,
                                            chunk.similarity_score};
  }
  return citation_map;
}

std::string CitationResolver::format_references(const CitationMap& citation_map) const {
  if (citation_map.empty()) {
    return "No citations found.";
  }

  std::vector<std::string> lines{"References:"};
  for (const auto& [number, source] : citation_map) {
    lines.push_back(fmt::format("[{}] {} ({} {}) - Relevance: {:.2f}", number, source.file_name,
                                section_label(source.section_kind), source.page_or_paragraph,
                                source.similarity_score));
  }
  return join(lines, "\n");
}

}  // namespace docu_core
