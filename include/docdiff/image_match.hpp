#pragma once
#include "docdiff/config.hpp"
#include "docdiff/model.hpp"
#include "docdiff/result.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace docdiff {

struct ImagePair {
  std::size_t a;
  std::size_t b;
  std::size_t distance;
};

// Partial bijection between the images of one page pair.
struct MatchAssignment {
  std::vector<ImagePair> pairs; // ascending by a
  std::vector<std::size_t> unmatched_a;
  std::vector<std::size_t> unmatched_b;
};

// Largest accepted Hamming distance for `width`-bit fingerprints.
std::size_t distance_cutoff(std::size_t width, double threshold);

/**
 * Greedy minimum-cost assignment on Hamming distance. Candidate pairs with
 * distance <= distance_cutoff(width, threshold) are taken in ascending
 * (distance, a + b, a) order when both images are still free. Two pairs that
 * compete for an image always differ in a + b, so swapping A and B yields
 * the same pairs. Greedy is not guaranteed optimal on crowded pages.
 * Throws std::invalid_argument when fingerprint widths differ.
 */
MatchAssignment match_images(std::span<const Image> a, std::span<const Image> b,
                             double threshold);

// One ImageChange per image of the page pair.
void diff_images(std::span<const Image> a, std::span<const Image> b, std::size_t page,
                 const Options &options, PageDiff &out);

} // namespace docdiff
