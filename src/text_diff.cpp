#include "docdiff/text_diff.hpp"

#include "docdiff/consts.hpp"
#include "docdiff/log.hpp"
#include "docdiff/units.hpp"

#include <map>
#include <utility>

namespace docdiff {

Digest token_signature(const Tokens &tokens) {
  Sha1 h;
  for (const auto &t : tokens) {
    h.update(t);
    h.update(consts::kTokenSep);
  }
  return h.finish();
}

void diff_text(std::span<const TextBlock> a, std::span<const TextBlock> b, std::size_t page,
               const Options &options, PageDiff &out) {
  std::vector<Tokens> ta, tb;
  std::vector<Digest> sa, sb;
  for (const auto &blk : a) {
    ta.push_back(tokenize(blk, options.normalization));
    sa.push_back(token_signature(ta.back()));
  }
  for (const auto &blk : b) {
    tb.push_back(tokenize(blk, options.normalization));
    sb.push_back(token_signature(tb.back()));
  }

  const AlignOptions ao = options.align_options();
  std::map<std::pair<std::size_t, std::size_t>, Alignment> aligned;
  auto alignment_of = [&](std::size_t i, std::size_t j) -> const Alignment & {
    auto it = aligned.find({i, j});
    if (it == aligned.end())
      it = aligned.emplace(std::make_pair(i, j), align(ta[i], tb[j], ao)).first;
    return it->second;
  };

  const UnitAlignment units = align_units(
      sa, sb, [&](std::size_t i, std::size_t j) { return alignment_of(i, j).similarity; },
      options.block_similarity_threshold, options.max_alignment_cost);
  if (units.degraded) {
    ++out.degraded;
    log::warn("page " + std::to_string(page) + ": text block alignment degraded (" +
              std::to_string(a.size()) + " vs " + std::to_string(b.size()) + " blocks)");
  }

  for (const auto &link : units.links) {
    TextChange c;
    if (link.kind != UnitMatch::Inserted) {
      c.block_a = link.a;
      c.a = Location{.page = page, .box = a[link.a].box};
    }
    if (link.kind != UnitMatch::Deleted) {
      c.block_b = link.b;
      c.b = Location{.page = page, .box = b[link.b].box};
    }
    switch (link.kind) {
    case UnitMatch::Same:
    case UnitMatch::Modified: {
      const Alignment &al = alignment_of(link.a, link.b);
      c.op = al.identical() ? OpKind::Equal : OpKind::Replace;
      c.similarity = al.similarity;
      c.runs = al.runs;
      c.hunks = al.hunks;
      if (al.degraded) {
        ++out.degraded;
        log::warn("page " + std::to_string(page) + ": block A#" + std::to_string(link.a) +
                  " / B#" + std::to_string(link.b) + " degraded to a single replace");
      }
      break;
    }
    case UnitMatch::Deleted:
      c.op = OpKind::Delete;
      c.similarity = 0.0;
      break;
    case UnitMatch::Inserted:
      c.op = OpKind::Insert;
      c.similarity = 0.0;
      break;
    }
    out.records.emplace_back(std::move(c));
  }
}

} // namespace docdiff
