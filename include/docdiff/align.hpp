#pragma once
#include "docdiff/consts.hpp"
#include "docdiff/normalize.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace docdiff {

enum class OpKind : std::uint8_t { Equal, Insert, Delete, Replace };

std::string_view op_name(OpKind op);

// A maximal stretch of one operation. Positions are token indices.
struct Run {
  OpKind op;
  std::size_t a_pos;
  std::size_t a_len;
  std::size_t b_pos;
  std::size_t b_len;
  double similarity; // 1 for Equal, 0 for Insert/Delete
};

// A group of changes with their surrounding context (equal runs clipped).
struct Hunk {
  std::size_t a_pos;
  std::size_t a_len;
  std::size_t b_pos;
  std::size_t b_len;
  std::vector<Run> runs;
};

struct AlignOptions {
  std::size_t context = consts::kContextSize;
  std::size_t max_cost = consts::kMaxAlignmentCost;
};

struct Alignment {
  std::vector<Run> runs;   // full edit script
  std::vector<Hunk> hunks; // non-equal runs with context
  std::size_t matched = 0; // LCS length (estimate when degraded)
  double similarity = 1.0; // matched / max length
  bool degraded = false;   // fell back to a single Replace

  [[nodiscard]] bool identical() const;
};

// Align two token sequences. Never throws on content: disjoint or too costly
// inputs degrade to one Replace run spanning both sequences.
Alignment align(const Tokens &a, const Tokens &b, const AlignOptions &options = {});

// LCS / max length over the characters of the space-joined tokens.
double char_similarity(const Tokens &a, const Tokens &b,
                       std::size_t max_cost = consts::kMaxAlignmentCost);

// Split raw text into lines (CR dropped, no trailing empty line).
Tokens split_lines(std::string_view text);

// Render a unified diff of two token sequences, one token per line.
// `label` is used in headers only. Output longer than `max_lines` keeps the
// head and tail around a truncation marker (0 = unlimited).
std::string unified_diff(const Tokens &a, const Tokens &b, std::string_view label,
                         std::size_t context = consts::kContextSize,
                         std::size_t max_lines = consts::kMaxDiffLines);

} // namespace docdiff
