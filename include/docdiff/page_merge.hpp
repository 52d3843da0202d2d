#pragma once
#include "docdiff/config.hpp"
#include "docdiff/model.hpp"
#include "docdiff/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace docdiff {

enum class Side : std::uint8_t { A, B };

// Where one source page lands inside a merged page.
struct Placement {
  std::optional<std::size_t> page; // absent for a blank pad
  double offset_x = 0;
  double offset_y = 0;
  double scale = 1;
  double width = 0;  // after scaling
  double height = 0; // after scaling

  [[nodiscard]] bool blank() const { return !page.has_value(); }
  [[nodiscard]] BBox project(const BBox &box) const;
};

struct Highlight {
  Side side;
  OpKind op;
  BBox box; // merged-page coordinates
};

struct MergedPage {
  std::size_t index = 0;
  double width = 0;
  double height = 0;
  Placement left;  // document A
  Placement right; // document B
  std::vector<Highlight> highlights;
};

/**
 * Lay page i of A beside page i of B, both scaled to the taller height.
 * The shorter document is padded with blank pages sized like the partner.
 * With options.highlight and a result, every non-Equal record is projected:
 * Delete marks A only, Insert B only, Replace both. options.max_pages caps
 * the number of merged pages. Throws Error(Stage::Merge) on degenerate
 * page sizes.
 */
std::vector<MergedPage> merge_pages(const Document &a, const Document &b,
                                    const DiffResult *result, const Options &options);

} // namespace docdiff
