#pragma once
#include "docdiff/hash.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace docdiff {

// Alignment of coarse units (table rows, text blocks) by content signature.
enum class UnitMatch : std::uint8_t { Same, Modified, Deleted, Inserted };

struct UnitLink {
  UnitMatch kind;
  std::size_t a = 0; // valid unless Inserted
  std::size_t b = 0; // valid unless Deleted
  double similarity = 0.0;
};

struct UnitAlignment {
  std::vector<UnitLink> links;
  bool degraded = false; // signature alignment exceeded the cost bound
};

using UnitSimilarity = std::function<double(std::size_t a, std::size_t b)>;

/**
 * Align units by signature with Myers, then pair the k-th deleted unit of
 * each gap with the k-th inserted one. Pairs scoring >= threshold are
 * Modified; the rest stay Deleted + Inserted. The candidate pairs never
 * depend on the threshold, so raising it can only split pairs.
 */
UnitAlignment align_units(const std::vector<Digest> &a, const std::vector<Digest> &b,
                          const UnitSimilarity &similarity, double threshold,
                          std::size_t max_cost);

} // namespace docdiff
