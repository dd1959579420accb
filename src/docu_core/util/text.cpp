#include "docu_core/util/text.hpp"

#include <utf8.h>

namespace docu_core {

bool is_ascii_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_blank(std::string_view text) {
  for (char c : text) {
    if (!is_ascii_space(c)) {
      return false;
    }
  }
  return true;
}

std::string trim(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && is_ascii_space(text[begin])) {
    ++begin;
  }
  while (end > begin && is_ascii_space(text[end - 1])) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

std::vector<std::string> split_words(std::string_view text) {
  std::vector<std::string> words;
  size_t i = 0;
  while (i < text.size()) {
    while (i < text.size() && is_ascii_space(text[i])) {
      ++i;
    }
    size_t start = i;
    while (i < text.size() && !is_ascii_space(text[i])) {
      ++i;
    }
    if (i > start) {
      words.emplace_back(text.substr(start, i - start));
    }
  }
  return words;
}

size_t count_words(std::string_view text) {
  size_t count = 0;
  bool in_word = false;
  for (char c : text) {
    if (is_ascii_space(c)) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++count;
    }
  }
  return count;
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out.append(separator);
    }
    out.append(parts[i]);
  }
  return out;
}

size_t utf8_length(const std::string& text) {
  return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

std::string utf8_prefix(const std::string& text, size_t max_chars) {
  auto it = text.begin();
  size_t taken = 0;
  while (it != text.end() && taken < max_chars) {
    utf8::next(it, text.end());
    ++taken;
  }
  return std::string(text.begin(), it);
}

}  // namespace docu_core
