#include "docdiff/assemble.hpp"

#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>
#include <tuple>
#include <type_traits>
#include <variant>

namespace docdiff {

std::string_view scope_name(TableScope scope) {
  switch (scope) {
  case TableScope::Table:
    return "table";
  case TableScope::Row:
    return "row";
  case TableScope::Column:
    return "column";
  case TableScope::Cell:
    return "cell";
  }
  return "?";
}

std::size_t DiffResult::count(OpKind op) const {
  return static_cast<std::size_t>(std::ranges::count_if(
      records, [op](const ChangeRecord &r) { return base_of(r).op == op; }));
}

namespace {

struct SortKey {
  std::size_t page;
  double top;
  std::size_t kind;
};

SortKey key_of(const ChangeRecord &rec) {
  const ChangeBase &c = base_of(rec);
  const std::optional<Location> &loc = c.a ? c.a : c.b;
  if (!loc)
    return SortKey{0, 0.0, rec.index()};
  return SortKey{loc->page, loc->box.y0, rec.index()};
}

} // namespace

DiffResult assemble(std::vector<PageDiff> pages) {
  std::ranges::stable_sort(pages, {}, &PageDiff::page);
  DiffResult out;
  for (auto &p : pages) {
    out.degraded_alignments += p.degraded;
    for (auto &r : p.records)
      out.records.push_back(std::move(r));
  }
  std::ranges::stable_sort(out.records, [](const ChangeRecord &x, const ChangeRecord &y) {
    const SortKey kx = key_of(x);
    const SortKey ky = key_of(y);
    return std::tie(kx.page, kx.top, kx.kind) < std::tie(ky.page, ky.top, ky.kind);
  });
  return out;
}

namespace {

// (side, page, kind, i, j, k) -> number of covering records
using ElementKey = std::tuple<char, std::size_t, char, std::size_t, std::size_t, std::size_t>;

class CoverageAudit {
public:
  CoverageAudit(const Document &a, const Document &b) : docs_{&a, &b} {
    for (int s = 0; s < 2; ++s) {
      const char side = s == 0 ? 'A' : 'B';
      for (const auto &page : docs_[s]->pages) {
        for (std::size_t i = 0; i < page.blocks.size(); ++i)
          seen_[{side, page.index, 'T', i, 0, 0}] = 0;
        for (std::size_t t = 0; t < page.tables.size(); ++t)
          for (std::size_t r = 0; r < page.tables[t].rows.size(); ++r)
            for (std::size_t c = 0; c < page.tables[t].rows[r].size(); ++c)
              seen_[{side, page.index, 'C', t, r, c}] = 0;
        for (std::size_t i = 0; i < page.images.size(); ++i)
          seen_[{side, page.index, 'I', i, 0, 0}] = 0;
      }
    }
  }

  void visit(const TextChange &c) {
    cover(c.a, c.block_a, 'A', 'T');
    cover(c.b, c.block_b, 'B', 'T');
  }

  void visit(const ImageChange &c) {
    cover(c.a, c.image_a, 'A', 'I');
    cover(c.b, c.image_b, 'B', 'I');
  }

  void visit(const TableChange &c) {
    table_side(c, c.a, 'A', c.table_a, c.row_a, c.column_a);
    table_side(c, c.b, 'B', c.table_b, c.row_b, c.column_b);
  }

  std::vector<std::string> finish() {
    for (const auto &[key, n] : seen_) {
      if (n == 1)
        continue;
      const auto &[side, page, kind, i, j, k] = key;
      std::ostringstream os;
      os << side << " page " << page << ' ' << element_name(kind) << ' ' << i;
      if (kind == 'C')
        os << " (" << j << "," << k << ")";
      os << (n == 0 ? " not covered" : " covered " + std::to_string(n) + " times");
      problems_.push_back(os.str());
    }
    return std::move(problems_);
  }

private:
  static std::string_view element_name(char kind) {
    return kind == 'T' ? "block" : kind == 'C' ? "table" : "image";
  }

  void cover(const std::optional<Location> &loc, const std::optional<std::size_t> &index, char s,
             char kind) {
    if (!loc)
      return;
    if (!index) {
      problems_.push_back(std::string(1, s) + " location without element index");
      return;
    }
    hit({s, loc->page, kind, *index, 0, 0});
  }

  void hit(const ElementKey &key) {
    auto it = seen_.find(key);
    if (it == seen_.end()) {
      const auto &[side, page, kind, i, j, k] = key;
      problems_.push_back(std::string(1, side) + " page " + std::to_string(page) +
                          ": record references missing " + std::string(element_name(kind)) +
                          " " + std::to_string(i));
      return;
    }
    ++it->second;
  }

  void table_side(const TableChange &c, const std::optional<Location> &loc, char s,
                  const std::optional<std::size_t> &table, const std::optional<std::size_t> &row,
                  const std::optional<std::size_t> &column) {
    if (!loc)
      return;
    const Document &doc = *docs_[s == 'A' ? 0 : 1];
    if (!table || loc->page >= doc.pages.size() || *table >= doc.pages[loc->page].tables.size()) {
      problems_.push_back(std::string(1, s) + " page " + std::to_string(loc->page) +
                          ": table record references a missing table");
      return;
    }
    const Table &t = doc.pages[loc->page].tables[*table];
    switch (c.scope) {
    case TableScope::Table:
      for (std::size_t r = 0; r < t.rows.size(); ++r)
        for (std::size_t k = 0; k < t.rows[r].size(); ++k)
          hit({s, loc->page, 'C', *table, r, k});
      break;
    case TableScope::Row:
      if (!row || *row >= t.rows.size()) {
        problems_.push_back(std::string(1, s) + ": row record references a missing row");
        return;
      }
      for (std::size_t k = 0; k < t.rows[*row].size(); ++k)
        hit({s, loc->page, 'C', *table, *row, k});
      break;
    case TableScope::Column:
    case TableScope::Cell:
      if (!row || !column) {
        problems_.push_back(std::string(1, s) + ": cell record without row/column");
        return;
      }
      hit({s, loc->page, 'C', *table, *row, *column});
      break;
    }
  }

  const Document *docs_[2];
  std::map<ElementKey, int> seen_;
  std::vector<std::string> problems_;
};

} // namespace

std::vector<std::string> audit_coverage(const Document &a, const Document &b,
                                        const DiffResult &result) {
  CoverageAudit audit(a, b);
  for (const auto &rec : result.records)
    std::visit([&](const auto &c) { audit.visit(c); }, rec);
  return audit.finish();
}

namespace {

void put_index(std::ostream &os, const char *name, const std::optional<std::size_t> &v) {
  if (v)
    os << ' ' << name << '=' << *v;
}

void put_location(std::ostream &os, char side, const std::optional<Location> &loc) {
  if (!loc)
    return;
  os << ' ' << side << "=p" << loc->page << '[' << loc->box.x0 << ',' << loc->box.y0 << ','
     << loc->box.x1 << ',' << loc->box.y1 << ']';
}

void put_run(std::ostream &os, const Run &r) {
  os << "    " << op_name(r.op) << " a" << r.a_pos << '+' << r.a_len << " b" << r.b_pos << '+'
     << r.b_len << " sim=" << r.similarity << '\n';
}

} // namespace

std::string format_result(const DiffResult &result) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(6);
  os << "records " << result.records.size() << " degraded " << result.degraded_alignments << '\n';
  for (const auto &rec : result.records) {
    std::visit(
        [&](const auto &c) {
          using T = std::decay_t<decltype(c)>;
          if constexpr (std::is_same_v<T, TextChange>) {
            os << "text";
          } else if constexpr (std::is_same_v<T, TableChange>) {
            os << "table." << scope_name(c.scope);
          } else {
            os << "image";
          }
          os << ' ' << op_name(c.op);
          put_location(os, 'A', c.a);
          put_location(os, 'B', c.b);
          os << " sim=" << c.similarity;
          if constexpr (std::is_same_v<T, TextChange>) {
            put_index(os, "block_a", c.block_a);
            put_index(os, "block_b", c.block_b);
            os << '\n';
            for (const auto &r : c.runs)
              put_run(os, r);
          } else if constexpr (std::is_same_v<T, TableChange>) {
            put_index(os, "table_a", c.table_a);
            put_index(os, "table_b", c.table_b);
            put_index(os, "row_a", c.row_a);
            put_index(os, "row_b", c.row_b);
            put_index(os, "col_a", c.column_a);
            put_index(os, "col_b", c.column_b);
            if (c.span_changed)
              os << " span_changed";
            os << '\n';
            for (const auto &r : c.runs)
              put_run(os, r);
          } else {
            put_index(os, "image_a", c.image_a);
            put_index(os, "image_b", c.image_b);
            os << " distance=" << c.distance << '\n';
          }
        },
        rec);
  }
  return os.str();
}

} // namespace docdiff
