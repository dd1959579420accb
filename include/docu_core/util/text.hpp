#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docu_core {

bool is_ascii_space(char c);
bool is_blank(std::string_view text);
std::string trim(std::string_view text);

// Whitespace separated words, as str.split() would produce them
std::vector<std::string> split_words(std::string_view text);
size_t count_words(std::string_view text);

std::string join(const std::vector<std::string>& parts, std::string_view separator);

// Code point length of valid UTF-8; throws utf8::exception on invalid input
size_t utf8_length(const std::string& text);

// First max_chars code points of text; text itself when it is short enough
std::string utf8_prefix(const std::string& text, size_t max_chars);

}  // namespace docu_core
