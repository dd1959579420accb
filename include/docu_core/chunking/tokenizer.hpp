#pragma once

#include <memory>
#include <string>

#include "docu_core/config.hpp"

namespace docu_core {

class Tokenizer {
 public:
  virtual ~Tokenizer() = default;

  virtual int count_tokens(const std::string& text) const = 0;
  virtual std::string name() const = 0;
};

/**
 * @brief GPT-style pre-tokenisation count.
 *
 * Counts runs of letters, runs of digits and every punctuation mark as one
 * token each. Non-ASCII code points are treated as letters. This tracks real
 * BPE counts far better than a word count but is not token parity with any
 * particular model.
 */
class PreTokenizer : public Tokenizer {
 public:
  int count_tokens(const std::string& text) const override;
  std::string name() const override {
    return "pretokenizer";
  }
};

// round(word_count * 1.33). An approximation, not token parity with any model.
int approximate_token_count(const std::string& text);

// nullptr for TokenizerKind::Approximate; the chunker then falls back to approximate_token_count
std::shared_ptr<const Tokenizer> make_tokenizer(TokenizerKind kind);

}  // namespace docu_core
