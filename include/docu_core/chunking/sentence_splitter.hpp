#pragma once

#include <string>
#include <vector>

namespace docu_core {

class SentenceSplitter {
 public:
  virtual ~SentenceSplitter() = default;

  // Trimmed, non-empty sentences in text order
  virtual std::vector<std::string> split(const std::string& text) const = 0;
};

/**
 * @brief Rule-based sentence boundary detection.
 *
 * A boundary follows '.', '!' or '?' (plus any trailing closing quotes or
 * brackets) when the next character is whitespace or the text ends. The CJK
 * terminators U+3002, U+FF01 and U+FF1F end a sentence unconditionally.
 * A period after a known abbreviation ("Dr.", "e.g.", ...) is not a boundary.
 * Decimals never split since their period is followed by a digit.
 */
class PunctuationSentenceSplitter : public SentenceSplitter {
 public:
  std::vector<std::string> split(const std::string& text) const override;
};

}  // namespace docu_core
