#pragma once

#include <string>

namespace docu_core {

// Chat-style answer generation. Failures surface as LlmError.
class TextGenerator {
 public:
  virtual ~TextGenerator() = default;

  virtual std::string generate(const std::string& system_prompt, const std::string& user_prompt) = 0;
  virtual std::string llm_model() const = 0;
};

}  // namespace docu_core
