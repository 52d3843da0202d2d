#include "docdiff/normalize.hpp"

#include <cctype>

namespace docdiff {

static bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

static bool is_punct(char c) {
  const auto u = static_cast<unsigned char>(c);
  return u < 0x80 && std::ispunct(u) != 0;
}

static void flush_word(std::string &cur, const NormalizationPolicy &policy, Tokens &out) {
  if (cur.empty())
    return;
  if (policy.strip_punctuation) {
    std::string kept;
    kept.reserve(cur.size());
    for (const char c : cur)
      if (!is_punct(c))
        kept.push_back(c);
    cur = std::move(kept);
  }
  if (policy.case_fold) {
    for (char &c : cur) {
      const auto u = static_cast<unsigned char>(c);
      if (u < 0x80)
        c = static_cast<char>(std::tolower(u));
    }
  }
  if (!cur.empty())
    out.push_back(std::move(cur));
  cur.clear();
}

Tokens tokenize(std::string_view text, const NormalizationPolicy &policy) {
  Tokens out;
  std::string word;
  std::string gap;
  for (const char c : text) {
    if (is_space(c)) {
      flush_word(word, policy, out);
      if (!policy.collapse_whitespace)
        gap.push_back(c);
      continue;
    }
    if (!gap.empty()) {
      // interior whitespace run, kept verbatim
      if (!out.empty())
        out.push_back(gap);
      gap.clear();
    }
    word.push_back(c);
  }
  flush_word(word, policy, out);
  return out;
}

} // namespace docdiff
