#pragma once

#include <string>
#include <vector>

#include "docu_core/config.hpp"
#include "docu_core/types/chunk.hpp"

namespace docu_core {

/**
 * @brief The exact chunk list a prompt was built from, with the prompts themselves.
 *
 * Source [n] in the prompt is chunks()[n - 1]. The context cannot be changed
 * after construction, so citation mapping always sees the order the
 * generator saw.
 */
class PromptContext {
 public:
  PromptContext(std::string query,
                std::vector<RetrievedChunk> chunks,
                std::string system_prompt,
                std::string user_prompt)
      : query_(std::move(query)),
        chunks_(std::move(chunks)),
        system_prompt_(std::move(system_prompt)),
        user_prompt_(std::move(user_prompt)) {}

  const std::string& query() const {
    return query_;
  }
  const std::vector<RetrievedChunk>& chunks() const {
    return chunks_;
  }
  const std::string& system_prompt() const {
    return system_prompt_;
  }
  const std::string& user_prompt() const {
    return user_prompt_;
  }

 private:
  std::string query_;
  std::vector<RetrievedChunk> chunks_;
  std::string system_prompt_;
  std::string user_prompt_;
};

class PromptBuilder {
 public:
  explicit PromptBuilder(const GenerationSettings& settings);

  PromptContext build(const std::string& query, std::vector<RetrievedChunk> chunks) const;

  // Numbered "[n] file - Page p" blocks with quoted, truncated excerpts
  std::string format_sources(const std::vector<RetrievedChunk>& chunks) const;

  static std::string system_prompt();
  std::string user_prompt(const std::string& query, const std::vector<RetrievedChunk>& chunks) const;

 private:
  size_t excerpt_max_chars_;
};

}  // namespace docu_core
