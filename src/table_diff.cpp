#include "docdiff/table_diff.hpp"

#include "docdiff/consts.hpp"
#include "docdiff/log.hpp"
#include "docdiff/units.hpp"

#include <algorithm>
#include <iterator>

namespace docdiff {

Digest row_signature(const Row &row, const NormalizationPolicy &policy) {
  Sha1 h;
  for (const auto &cell : row) {
    for (const auto &t : tokenize(cell, policy)) {
      h.update(t);
      h.update(consts::kTokenSep);
    }
    h.update(cell.merged_span ? '1' : '0');
    h.update(consts::kCellSep);
  }
  return h.finish();
}

static Tokens flatten(const Row &row, const NormalizationPolicy &policy) {
  Tokens out;
  for (const auto &cell : row) {
    Tokens t = tokenize(cell, policy);
    out.insert(out.end(), std::make_move_iterator(t.begin()), std::make_move_iterator(t.end()));
  }
  return out;
}

static TableChange whole_table(const Table &t, std::size_t page, std::size_t index, bool in_a) {
  TableChange c;
  c.scope = TableScope::Table;
  c.op = in_a ? OpKind::Delete : OpKind::Insert;
  c.similarity = 0.0;
  const Location loc{.page = page, .box = t.box};
  if (in_a) {
    c.a = loc;
    c.table_a = index;
  } else {
    c.b = loc;
    c.table_b = index;
  }
  return c;
}

static void diff_row(const Table &a, const Table &b, std::size_t page, std::size_t ia,
                     std::size_t ib, std::size_t ra, std::size_t rb, const Options &options,
                     PageDiff &out) {
  const Row &row_a = a.rows[ra];
  const Row &row_b = b.rows[rb];
  const std::size_t shared = std::min(row_a.size(), row_b.size());
  const AlignOptions ao = options.align_options();

  auto cell_change = [&](TableScope scope) {
    TableChange c;
    c.scope = scope;
    c.table_a = ia;
    c.table_b = ib;
    c.row_a = ra;
    c.row_b = rb;
    return c;
  };

  for (std::size_t col = 0; col < shared; ++col) {
    const Cell &ca = row_a[col];
    const Cell &cb = row_b[col];
    const Alignment al =
        align(tokenize(ca, options.normalization), tokenize(cb, options.normalization), ao);
    TableChange c = cell_change(TableScope::Cell);
    c.column_a = col;
    c.column_b = col;
    c.a = Location{.page = page, .box = cell_box(a, ra, col)};
    c.b = Location{.page = page, .box = cell_box(b, rb, col)};
    c.span_changed = ca.merged_span != cb.merged_span;
    c.op = (al.identical() && !c.span_changed) ? OpKind::Equal : OpKind::Replace;
    c.similarity = al.similarity;
    c.runs = al.runs;
    c.hunks = al.hunks;
    if (al.degraded) {
      ++out.degraded;
      log::warn("page " + std::to_string(page) + ": table " + std::to_string(ia) + " cell (" +
                std::to_string(ra) + "," + std::to_string(col) +
                ") degraded to a single replace");
    }
    out.records.emplace_back(std::move(c));
  }

  // trailing columns of the longer row
  for (std::size_t col = shared; col < row_a.size(); ++col) {
    TableChange c = cell_change(TableScope::Column);
    c.op = OpKind::Delete;
    c.similarity = 0.0;
    c.column_a = col;
    c.a = Location{.page = page, .box = cell_box(a, ra, col)};
    out.records.emplace_back(std::move(c));
  }
  for (std::size_t col = shared; col < row_b.size(); ++col) {
    TableChange c = cell_change(TableScope::Column);
    c.op = OpKind::Insert;
    c.similarity = 0.0;
    c.column_b = col;
    c.b = Location{.page = page, .box = cell_box(b, rb, col)};
    out.records.emplace_back(std::move(c));
  }
}

void diff_table(const Table &a, const Table &b, std::size_t page, std::size_t index_a,
                std::size_t index_b, const Options &options, PageDiff &out) {
  if (a.rows.empty() || b.rows.empty()) {
    TableChange c;
    if (a.rows.empty() && b.rows.empty()) {
      c.scope = TableScope::Table;
      c.op = OpKind::Equal;
      c.a = Location{.page = page, .box = a.box};
      c.b = Location{.page = page, .box = b.box};
      c.table_a = index_a;
      c.table_b = index_b;
    } else {
      c = whole_table(a.rows.empty() ? b : a, page, a.rows.empty() ? index_b : index_a,
                      !a.rows.empty());
    }
    out.records.emplace_back(std::move(c));
    return;
  }

  const auto &policy = options.normalization;
  std::vector<Digest> sa, sb;
  std::vector<Tokens> fa, fb;
  for (const auto &row : a.rows) {
    sa.push_back(row_signature(row, policy));
    fa.push_back(flatten(row, policy));
  }
  for (const auto &row : b.rows) {
    sb.push_back(row_signature(row, policy));
    fb.push_back(flatten(row, policy));
  }

  const AlignOptions ao = options.align_options();
  const UnitAlignment units = align_units(
      sa, sb, [&](std::size_t i, std::size_t j) { return align(fa[i], fb[j], ao).similarity; },
      options.row_similarity_threshold, options.max_alignment_cost);
  if (units.degraded) {
    ++out.degraded;
    log::warn("page " + std::to_string(page) + ": table " + std::to_string(index_a) +
              " row alignment degraded (" + std::to_string(a.rows.size()) + " vs " +
              std::to_string(b.rows.size()) + " rows)");
  }

  for (const auto &link : units.links) {
    if (link.kind == UnitMatch::Same || link.kind == UnitMatch::Modified) {
      diff_row(a, b, page, index_a, index_b, link.a, link.b, options, out);
      continue;
    }
    TableChange c;
    c.scope = TableScope::Row;
    c.similarity = 0.0;
    c.table_a = index_a;
    c.table_b = index_b;
    if (link.kind == UnitMatch::Deleted) {
      c.op = OpKind::Delete;
      c.row_a = link.a;
      c.a = Location{.page = page, .box = row_box(a, link.a)};
    } else {
      c.op = OpKind::Insert;
      c.row_b = link.b;
      c.b = Location{.page = page, .box = row_box(b, link.b)};
    }
    out.records.emplace_back(std::move(c));
  }
}

void diff_tables(std::span<const Table> a, std::span<const Table> b, std::size_t page,
                 const Options &options, PageDiff &out) {
  const std::size_t n = std::max(a.size(), b.size());
  for (std::size_t k = 0; k < n; ++k) {
    if (k < a.size() && k < b.size()) {
      diff_table(a[k], b[k], page, k, k, options, out);
    } else if (k < a.size()) {
      out.records.emplace_back(whole_table(a[k], page, k, true));
    } else {
      out.records.emplace_back(whole_table(b[k], page, k, false));
    }
  }
  if (a.size() != b.size()) {
    log::debug("page " + std::to_string(page) + ": table count differs (" +
               std::to_string(a.size()) + " vs " + std::to_string(b.size()) + ")");
  }
}

} // namespace docdiff
