#include "docu_core/chunking/tokenizer.hpp"

#include <utf8.h>

#include <cmath>
#include <cstdint>

#include "docu_core/util/text.hpp"

namespace docu_core {

namespace {

enum class CharClass { Space, Letter, Digit, Punctuation };

CharClass classify(uint32_t cp) {
  if (cp < 0x80) {
    const char c = static_cast<char>(cp);
    if (is_ascii_space(c))
      return CharClass::Space;
    if (c >= '0' && c <= '9')
      return CharClass::Digit;
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_')
      return CharClass::Letter;
    return CharClass::Punctuation;
  }
  return CharClass::Letter;
}

}  // namespace

int PreTokenizer::count_tokens(const std::string& text) const {
  int tokens = 0;
  CharClass previous = CharClass::Space;
  for (auto it = text.begin(); it != text.end();) {
    const CharClass current = classify(utf8::next(it, text.end()));
    switch (current) {
      case CharClass::Space:
        break;
      case CharClass::Punctuation:
        ++tokens;
        break;
      case CharClass::Letter:
      case CharClass::Digit:
        if (current != previous) {
          ++tokens;
        }
        break;
    }
    previous = current;
  }
  return tokens;
}

int approximate_token_count(const std::string& text) {
  return static_cast<int>(std::lround(static_cast<double>(count_words(text)) * 1.33));
}

std::shared_ptr<const Tokenizer> make_tokenizer(TokenizerKind kind) {
  switch (kind) {
    case TokenizerKind::PreTokenizer:
      return std::make_shared<PreTokenizer>();
    case TokenizerKind::Approximate:
      return nullptr;
  }
  return nullptr;
}

}  // namespace docu_core
