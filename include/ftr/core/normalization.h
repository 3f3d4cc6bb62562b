#pragma once

#include <string>
#include <string_view>

namespace ftr::core {

// Deterministic ASCII-only normalization used for merchant-name comparison.
// Locale-independent: the same input yields the same bytes on every platform.

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII bytes are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// normalize_name_key produces the comparison key for merchant names and aliases:
// trimmed, ASCII-lowercased, internal whitespace runs collapsed to a single space.
// "  Coffee   PALACE " and "coffee palace" share the key "coffee palace".
inline std::string normalize_name_key(const std::string_view input) {
  const std::string trimmed = trim(input);

  std::string key;
  key.reserve(trimmed.size());
  bool previous_space = false;
  for (const char ch : trimmed) {
    if (is_ascii_space(ch)) {
      if (!previous_space) {
        key.push_back(' ');
      }
      previous_space = true;
      continue;
    }
    previous_space = false;
    if (ch >= 'A' && ch <= 'Z') {
      key.push_back(static_cast<char>(ch + ('a' - 'A')));
    } else {
      key.push_back(ch);
    }
  }
  return key;
}

// contains_name_key is true when needle's key occurs inside haystack's key.
// An empty needle never matches.
inline bool contains_name_key(const std::string_view haystack, const std::string_view needle) {
  const std::string needle_key = normalize_name_key(needle);
  if (needle_key.empty()) {
    return false;
  }
  return normalize_name_key(haystack).find(needle_key) != std::string::npos;
}

}  // namespace ftr::core
