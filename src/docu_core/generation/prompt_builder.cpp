#include "docu_core/generation/prompt_builder.hpp"

#include "docu_core/errors.hpp"
#include "docu_core/util/text.hpp"

namespace docu_core {

PromptBuilder::PromptBuilder(const GenerationSettings& settings)
    : excerpt_max_chars_(static_cast<size_t>(settings.excerpt_max_chars)) {
  if (settings.excerpt_max_chars <= 0) {
    throw ValidationError("excerpt_max_chars must be greater than 0");
  }
}

PromptContext PromptBuilder::build(const std::string& query, std::vector<RetrievedChunk> chunks) const {
  std::string user = user_prompt(query, chunks);
  return PromptContext(query, std::move(chunks), system_prompt(), std::move(user));
}

std::string PromptBuilder::format_sources(const std::vector<RetrievedChunk>& chunks) const {
  std::vector<std::string> blocks;
  blocks.reserve(chunks.size());
  for (size_t i = 0; i < chunks.size(); ++i) {
    const auto& chunk = chunks[i];
    std::string excerpt = utf8_prefix(chunk.text, excerpt_max_chars_);
    if (excerpt.size() < chunk.text.size()) {
      excerpt += "...";
    }
    const std::string file_name =
        chunk.provenance.file_name.empty() ? "Unknown" : chunk.provenance.file_name;
    blocks.push_back("[" + std::to_string(i + 1) + "] " + file_name + " - " +
                     section_label(chunk.provenance.section_kind) + " " +
                     std::to_string(chunk.provenance.page_or_paragraph) + "\n\"" + excerpt + "\"");
  }
  return join(blocks, "\n\n");
}

std::string PromptBuilder::system_prompt() {
  return R"(You are a helpful AI assistant that answers questions based ONLY on the provided source documents.

Your task:
1. Read the sources carefully
2. Provide a comprehensive, detailed answer to the user's question
3. ALWAYS cite your sources using [1], [2], etc. notation after each statement
4. If the information is not found in the sources, clearly state: "I don't find supporting information in the provided sources."
5. Do not make up or infer information beyond what's explicitly stated in the sources

Format your answer as:
- Provide a thorough, well-explained answer to the question
- Support each claim with citations [1], [2], etc.
- Include relevant details and context from the sources
- At the end, add a "Sources used:" section listing the sources

Be detailed, precise, and helpful. Aim for comprehensive answers that fully address the question.)";
}

std::string PromptBuilder::user_prompt(const std::string& query,
                                       const std::vector<RetrievedChunk>& chunks) const {
  return "Sources:\n" + format_sources(chunks) + "\n\nQuestion: " + query +
         "\n\nPlease answer the question using only the sources provided above. "
         "Remember to cite your sources using [1], [2], etc.";
}

}  // namespace docu_core
