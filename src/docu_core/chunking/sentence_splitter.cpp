#include "docu_core/chunking/sentence_splitter.hpp"

#include <utf8.h>

#include <cstdint>
#include <unordered_set>

#include "docu_core/util/text.hpp"

namespace docu_core {

namespace {

bool is_ascii_terminator(uint32_t cp) {
  return cp == '.' || cp == '!' || cp == '?';
}

// 。 ！ ？
bool is_cjk_terminator(uint32_t cp) {
  return cp == 0x3002 || cp == 0xFF01 || cp == 0xFF1F;
}

bool is_closing_mark(uint32_t cp) {
  return cp == '"' || cp == '\'' || cp == ')' || cp == ']' || cp == 0x2019 || cp == 0x201D ||
         cp == 0x300D || cp == 0x300F;
}

bool is_abbreviation(const std::string& word) {
  static const std::unordered_set<std::string> abbreviations = {
      "mr", "mrs", "ms", "dr", "jr", "sr", "st", "vs", "etc", "e.g", "i.e"};
  return abbreviations.count(word) > 0;
}

// Lowercased word that ends right before the period at period_pos
std::string word_before(const std::string& text, size_t period_pos) {
  size_t start = period_pos;
  while (start > 0 && !is_ascii_space(text[start - 1])) {
    --start;
  }
  std::string word = text.substr(start, period_pos - start);
  while (!word.empty() && (word.front() == '(' || word.front() == '"' || word.front() == '\'')) {
    word.erase(0, 1);
  }
  for (char& c : word) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return word;
}

void append_sentence(std::vector<std::string>& sentences,
                     std::string::const_iterator from,
                     std::string::const_iterator to) {
  std::string sentence = trim(std::string(from, to));
  if (!sentence.empty()) {
    sentences.push_back(std::move(sentence));
  }
}

}  // namespace

std::vector<std::string> PunctuationSentenceSplitter::split(const std::string& text) const {
  std::vector<std::string> sentences;
  const auto end = text.end();
  auto sentence_start = text.begin();
  auto it = text.begin();

  while (it != end) {
    const auto terminator = it;
    const uint32_t cp = utf8::next(it, end);
    const bool cjk = is_cjk_terminator(cp);
    if (!cjk && !is_ascii_terminator(cp)) {
      continue;
    }

    // Absorb "?!", "..." and closing quotes into the sentence being ended
    auto boundary = it;
    while (boundary != end) {
      auto probe = boundary;
      const uint32_t next_cp = utf8::next(probe, end);
      if (!is_ascii_terminator(next_cp) && !is_cjk_terminator(next_cp) &&
          !is_closing_mark(next_cp)) {
        break;
      }
      boundary = probe;
    }

    if (!cjk) {
      if (boundary != end && !is_ascii_space(*boundary)) {
        it = boundary;
        continue;
      }
      if (cp == '.' &&
          is_abbreviation(word_before(text, static_cast<size_t>(terminator - text.begin())))) {
        it = boundary;
        continue;
      }
    }

    append_sentence(sentences, sentence_start, boundary);
    sentence_start = boundary;
    it = boundary;
  }

  append_sentence(sentences, sentence_start, end);
  return sentences;
}

}  // namespace docu_core
