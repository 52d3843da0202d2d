#pragma once
#include "docdiff/model.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace docdiff {

struct NormalizationPolicy {
  bool case_fold = true;           // ASCII lower-casing; UTF-8 bytes pass through
  bool collapse_whitespace = true; // false: whitespace runs become verbatim tokens
  bool strip_punctuation = false;  // drop ASCII punctuation; empty tokens vanish
};

using Tokens = std::vector<std::string>;

// Pure: the same text and policy always give the same tokens.
Tokens tokenize(std::string_view text, const NormalizationPolicy &policy);

inline Tokens tokenize(const TextBlock &block, const NormalizationPolicy &policy) {
  return tokenize(block.text, policy);
}

inline Tokens tokenize(const Cell &cell, const NormalizationPolicy &policy) {
  return tokenize(cell.text, policy);
}

} // namespace docdiff
