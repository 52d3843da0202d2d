#include "docdiff/image_match.hpp"

#include "docdiff/log.hpp"

#include <algorithm>
#include <cmath>
#include <tuple>

namespace docdiff {

std::size_t distance_cutoff(std::size_t width, double threshold) {
  return static_cast<std::size_t>(std::floor(threshold * static_cast<double>(width) + 1e-9));
}

MatchAssignment match_images(std::span<const Image> a, std::span<const Image> b,
                             double threshold) {
  std::vector<ImagePair> candidates;
  for (std::size_t i = 0; i < a.size(); ++i) {
    const Fingerprint &fa = a[i].fingerprint();
    for (std::size_t j = 0; j < b.size(); ++j) {
      const Fingerprint &fb = b[j].fingerprint();
      const std::size_t d = hamming(fa, fb);
      if (d <= distance_cutoff(fa.width(), threshold))
        candidates.push_back(ImagePair{.a = i, .b = j, .distance = d});
    }
  }
  std::ranges::sort(candidates, [](const ImagePair &x, const ImagePair &y) {
    return std::make_tuple(x.distance, x.a + x.b, x.a) <
           std::make_tuple(y.distance, y.a + y.b, y.a);
  });

  std::vector<bool> used_a(a.size(), false), used_b(b.size(), false);
  MatchAssignment out;
  for (const auto &c : candidates) {
    if (used_a[c.a] || used_b[c.b])
      continue;
    used_a[c.a] = true;
    used_b[c.b] = true;
    out.pairs.push_back(c);
  }
  std::ranges::sort(out.pairs, {}, &ImagePair::a);
  for (std::size_t i = 0; i < a.size(); ++i)
    if (!used_a[i])
      out.unmatched_a.push_back(i);
  for (std::size_t j = 0; j < b.size(); ++j)
    if (!used_b[j])
      out.unmatched_b.push_back(j);
  return out;
}

void diff_images(std::span<const Image> a, std::span<const Image> b, std::size_t page,
                 const Options &options, PageDiff &out) {
  const MatchAssignment m = match_images(a, b, options.image_similarity_threshold);

  for (const auto &p : m.pairs) {
    ImageChange c;
    c.image_a = p.a;
    c.image_b = p.b;
    c.a = Location{.page = page, .box = a[p.a].box()};
    c.b = Location{.page = page, .box = b[p.b].box()};
    c.distance = p.distance;
    const auto width = static_cast<double>(a[p.a].fingerprint().width());
    c.op = p.distance == 0 ? OpKind::Equal : OpKind::Replace;
    c.similarity = 1.0 - static_cast<double>(p.distance) / width;
    out.records.emplace_back(std::move(c));
  }
  for (const std::size_t i : m.unmatched_a) {
    ImageChange c;
    c.op = OpKind::Delete;
    c.similarity = 0.0;
    c.image_a = i;
    c.a = Location{.page = page, .box = a[i].box()};
    out.records.emplace_back(std::move(c));
  }
  for (const std::size_t j : m.unmatched_b) {
    ImageChange c;
    c.op = OpKind::Insert;
    c.similarity = 0.0;
    c.image_b = j;
    c.b = Location{.page = page, .box = b[j].box()};
    out.records.emplace_back(std::move(c));
  }
  log::debug("page " + std::to_string(page) + ": " + std::to_string(m.pairs.size()) +
             " image pair(s), " + std::to_string(m.unmatched_a.size()) + " deleted, " +
             std::to_string(m.unmatched_b.size()) + " inserted");
}

} // namespace docdiff
