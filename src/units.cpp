#include "docdiff/units.hpp"

#include "docdiff/detail/myers.hpp"

namespace docdiff {

static void flush_gap(std::vector<std::size_t> &dels, std::vector<std::size_t> &ins,
                      const UnitSimilarity &similarity, double threshold,
                      std::vector<UnitLink> &out) {
  const std::size_t paired = std::min(dels.size(), ins.size());
  for (std::size_t k = 0; k < paired; ++k) {
    const double sim = similarity(dels[k], ins[k]);
    if (sim >= threshold) {
      out.push_back(UnitLink{UnitMatch::Modified, dels[k], ins[k], sim});
    } else {
      out.push_back(UnitLink{UnitMatch::Deleted, dels[k], 0, 0.0});
      out.push_back(UnitLink{UnitMatch::Inserted, 0, ins[k], 0.0});
    }
  }
  for (std::size_t k = paired; k < dels.size(); ++k)
    out.push_back(UnitLink{UnitMatch::Deleted, dels[k], 0, 0.0});
  for (std::size_t k = paired; k < ins.size(); ++k)
    out.push_back(UnitLink{UnitMatch::Inserted, 0, ins[k], 0.0});
  dels.clear();
  ins.clear();
}

UnitAlignment align_units(const std::vector<Digest> &a, const std::vector<Digest> &b,
                          const UnitSimilarity &similarity, double threshold,
                          std::size_t max_cost) {
  UnitAlignment out;
  auto ops = detail::edit_ops<Digest>(a, b, max_cost);
  if (!ops) {
    // one gap spanning everything: positional pairing only
    out.degraded = true;
    ops = std::vector<char>(a.size(), '-');
    ops->insert(ops->end(), b.size(), '+');
  }

  std::vector<std::size_t> dels, ins;
  std::size_t ia = 0, ib = 0;
  for (const char op : *ops) {
    if (op == '=') {
      flush_gap(dels, ins, similarity, threshold, out.links);
      out.links.push_back(UnitLink{UnitMatch::Same, ia++, ib++, 1.0});
    } else if (op == '-') {
      dels.push_back(ia++);
    } else {
      ins.push_back(ib++);
    }
  }
  flush_gap(dels, ins, similarity, threshold, out.links);
  return out;
}

} // namespace docdiff
