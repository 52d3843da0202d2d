#pragma once
#include "docdiff/align.hpp"
#include "docdiff/consts.hpp"
#include "docdiff/log.hpp"
#include "docdiff/normalize.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>

namespace docdiff {

std::size_t default_parallelism();

struct Options {
  NormalizationPolicy normalization;
  std::size_t context_size = consts::kContextSize;
  double row_similarity_threshold = consts::kRowSimilarity;
  double block_similarity_threshold = consts::kBlockSimilarity;
  double image_similarity_threshold = consts::kImageDistanceFraction; // fraction of bit width
  std::size_t parallelism = default_parallelism();
  bool highlight = true;
  std::size_t max_alignment_cost = consts::kMaxAlignmentCost;
  std::optional<std::size_t> max_pages; // merged page limit
  log::Level log_level = log::Level::Warn;

  // Throws ConfigError on out-of-range values.
  void validate() const;

  [[nodiscard]] AlignOptions align_options() const {
    return AlignOptions{.context = context_size, .max_cost = max_alignment_cost};
  }
};

/**
 * Parse "key: value" lines ('#' starts a comment line). Keys:
 *   case_fold, collapse_whitespace, strip_punctuation, highlight   (true/false)
 *   context_size, parallelism, max_alignment_cost, max_pages        (integers)
 *   row_similarity_threshold, block_similarity_threshold,
 *   image_similarity_threshold                                     (0..1)
 *   log_level                                        (debug|info|warn|error|off)
 * Missing keys keep their defaults. Throws ConfigError.
 */
Options parse_options(std::string_view text);

// Read and parse a config file. Throws ConfigError (also when unreadable).
Options load_options(const std::filesystem::path &path);

// Apply the logging part of the options to the process-wide logger.
void configure_logging(const Options &options);

} // namespace docdiff
