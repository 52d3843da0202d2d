#include "docdiff/page_merge.hpp"

#include "docdiff/errors.hpp"
#include "docdiff/log.hpp"

#include <algorithm>

namespace docdiff {

BBox Placement::project(const BBox &box) const {
  return BBox{.x0 = offset_x + box.x0 * scale,
              .y0 = offset_y + box.y0 * scale,
              .x1 = offset_x + box.x1 * scale,
              .y1 = offset_y + box.y1 * scale};
}

static void check_size(const PageSize &s, const std::string &label, std::size_t page) {
  if (!(s.width > 0 && s.height > 0)) {
    throw Error(Stage::Merge, "merge: page " + std::to_string(page) + " of '" + label +
                                  "' has a degenerate size");
  }
}

static Placement place(std::optional<std::size_t> page, const PageSize &size, double height,
                       double offset_x) {
  Placement p;
  p.page = page;
  p.scale = height / size.height;
  p.offset_x = offset_x;
  p.width = size.width * p.scale;
  p.height = height;
  return p;
}

static void project(const std::optional<Location> &loc, Side side, OpKind op,
                    std::vector<MergedPage> &pages) {
  if (!loc || loc->page >= pages.size())
    return;
  MergedPage &mp = pages[loc->page];
  const Placement &pl = side == Side::A ? mp.left : mp.right;
  if (pl.blank())
    return;
  mp.highlights.push_back(Highlight{.side = side, .op = op, .box = pl.project(loc->box)});
}

std::vector<MergedPage> merge_pages(const Document &a, const Document &b,
                                    const DiffResult *result, const Options &options) {
  std::size_t total = std::max(a.pages.size(), b.pages.size());
  if (options.max_pages)
    total = std::min(total, *options.max_pages);

  std::vector<MergedPage> out;
  out.reserve(total);
  for (std::size_t i = 0; i < total; ++i) {
    const Page *pa = i < a.pages.size() ? &a.pages[i] : nullptr;
    const Page *pb = i < b.pages.size() ? &b.pages[i] : nullptr;
    if (pa)
      check_size(pa->size, a.label, i);
    if (pb)
      check_size(pb->size, b.label, i);
    // blank pads take the partner's size
    const PageSize sa = pa ? pa->size : pb->size;
    const PageSize sb = pb ? pb->size : pa->size;

    MergedPage mp;
    mp.index = i;
    mp.height = std::max(sa.height, sb.height);
    mp.left = place(pa ? std::optional<std::size_t>(i) : std::nullopt, sa, mp.height, 0.0);
    mp.right =
        place(pb ? std::optional<std::size_t>(i) : std::nullopt, sb, mp.height, mp.left.width);
    mp.width = mp.left.width + mp.right.width;
    out.push_back(std::move(mp));
  }

  if (options.highlight && result) {
    for (const auto &rec : result->records) {
      const ChangeBase &c = base_of(rec);
      if (c.op == OpKind::Equal)
        continue;
      project(c.a, Side::A, c.op, out);
      project(c.b, Side::B, c.op, out);
    }
  }
  log::debug("merged " + std::to_string(out.size()) + " page pair(s)");
  return out;
}

} // namespace docdiff
