#include "docdiff/table_diff.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

using docdiff::BBox;
using docdiff::Cell;
using docdiff::OpKind;
using docdiff::Options;
using docdiff::PageDiff;
using docdiff::Row;
using docdiff::Table;
using docdiff::TableChange;
using docdiff::TableScope;

static Row row(std::initializer_list<const char *> texts) {
  Row r;
  for (const char *t : texts)
    r.push_back(Cell{.text = t});
  return r;
}

static Table table(std::vector<Row> rows) {
  return Table{.rows = std::move(rows), .box = BBox{.x0 = 0, .y0 = 0, .x1 = 100, .y1 = 40}};
}

static std::vector<TableChange> changes(const PageDiff &pd) {
  std::vector<TableChange> out;
  for (const auto &rec : pd.records)
    out.push_back(std::get<TableChange>(rec));
  return out;
}

static std::size_t count_scope(const std::vector<TableChange> &cs, TableScope scope, OpKind op) {
  std::size_t n = 0;
  for (const auto &c : cs)
    if (c.scope == scope && c.op == op)
      ++n;
  return n;
}

int main() {
  const Options opts;

  // Edited cell inside a matched row
  {
    PageDiff pd;
    docdiff::diff_table(table({row({"Brand", "Acme"})}), table({row({"Brand", "Acme Pro"})}), 0, 0,
                        0, opts, pd);
    auto cs = changes(pd);
    if (cs.size() != 2) { std::cerr << "expected two cell records, got " << cs.size() << "\n"; return 1; }
    if (cs[0].scope != TableScope::Cell || cs[0].op != OpKind::Equal) { std::cerr << "first cell should be equal\n"; return 1; }
    const auto &c = cs[1];
    if (c.scope != TableScope::Cell || c.op != OpKind::Replace || c.column_a != 1u || c.row_b != 0u) {
      std::cerr << "second cell should be replaced\n"; return 1;
    }
    if (std::fabs(c.similarity - 0.5) > 1e-9) { std::cerr << "cell similarity " << c.similarity << "\n"; return 1; }
    if (!c.a || !c.b || c.a->box.x0 != 50.0) { std::cerr << "cell box not derived from the grid\n"; return 1; }
    if (c.runs.size() != 2 || c.runs[0].op != OpKind::Equal || c.runs[1].op != OpKind::Insert ||
        c.runs[1].b_pos != 1 || c.runs[1].b_len != 1 || c.hunks.size() != 1) {
      std::cerr << "cell edit script should keep 'acme' and insert 'pro'\n"; return 1;
    }
    if (!cs[0].runs.empty() && cs[0].runs[0].op != OpKind::Equal) { std::cerr << "equal cell script\n"; return 1; }
  }

  // Raising the row threshold splits pairs, never joins them
  {
    const Table a = table({row({"Brand", "Acme"})});
    const Table b = table({row({"Brand", "Acme Pro"})});
    std::size_t previous = 0;
    for (double th : {0.0, 0.5, 0.6, 0.7, 0.9, 1.0}) {
      Options o;
      o.row_similarity_threshold = th;
      PageDiff pd;
      docdiff::diff_table(a, b, 0, 0, 0, o, pd);
      const auto cs = changes(pd);
      const std::size_t split = count_scope(cs, TableScope::Row, OpKind::Delete);
      if (split < previous) { std::cerr << "row pairing not monotone at " << th << "\n"; return 1; }
      previous = split;
    }
    if (previous != 1) { std::cerr << "threshold 1.0 should split the rows\n"; return 1; }
  }

  // Unmatched rows
  {
    const Table a = table({row({"Size"}), row({"10"}), row({"20"})});
    const Table b = table({row({"Size"}), row({"completely new"}), row({"10"}), row({"20"})});
    PageDiff pd;
    docdiff::diff_table(a, b, 2, 0, 0, opts, pd);
    auto cs = changes(pd);
    if (count_scope(cs, TableScope::Row, OpKind::Insert) != 1 ||
        count_scope(cs, TableScope::Cell, OpKind::Equal) != 3 || cs.size() != 4) {
      std::cerr << "expected one inserted row and three equal cells\n"; return 1;
    }
    for (const auto &c : cs) {
      if (c.scope != TableScope::Row)
        continue;
      if (c.row_b != 1u || c.a || !c.b || c.b->page != 2) { std::cerr << "inserted row location\n"; return 1; }
      if (c.b->box.y0 != 10.0 || c.b->box.y1 != 20.0) { std::cerr << "inserted row box\n"; return 1; }
    }
  }

  // Rows of different width
  {
    PageDiff pd;
    docdiff::diff_table(table({row({"x", "y", "z"})}), table({row({"x", "y"})}), 0, 0, 0, opts, pd);
    auto cs = changes(pd);
    if (count_scope(cs, TableScope::Cell, OpKind::Equal) != 2 ||
        count_scope(cs, TableScope::Column, OpKind::Delete) != 1) {
      std::cerr << "extra column should be deleted\n"; return 1;
    }
  }

  // Merged-span change with identical text
  {
    Table a = table({row({"Total", "5"})});
    Table b = a;
    b.rows[0][0].merged_span = true;
    PageDiff pd;
    docdiff::diff_table(a, b, 0, 0, 0, opts, pd);
    auto cs = changes(pd);
    if (cs.size() != 2 || cs[0].op != OpKind::Replace || !cs[0].span_changed || cs[0].similarity != 1.0) {
      std::cerr << "span change not reported\n"; return 1;
    }
  }

  // Tables without rows
  {
    PageDiff both;
    docdiff::diff_table(table({}), table({}), 0, 0, 0, opts, both);
    auto cs = changes(both);
    if (cs.size() != 1 || cs[0].scope != TableScope::Table || cs[0].op != OpKind::Equal) {
      std::cerr << "two empty tables should be equal\n"; return 1;
    }
    PageDiff one;
    docdiff::diff_table(table({}), table({row({"a"})}), 0, 2, 3, opts, one);
    cs = changes(one);
    if (cs.size() != 1 || cs[0].scope != TableScope::Table || cs[0].op != OpKind::Insert || cs[0].a) {
      std::cerr << "empty vs filled table should be an insert\n"; return 1;
    }
    if (cs[0].table_a || cs[0].table_b != 3u) {
      std::cerr << "only the side holding the table gets an index\n"; return 1;
    }
  }

  // Surplus tables on one side
  {
    const std::vector<Table> a = {table({row({"a"})}), table({row({"b"})})};
    const std::vector<Table> b = {table({row({"a"})})};
    PageDiff pd;
    docdiff::diff_tables(a, b, 0, opts, pd);
    auto cs = changes(pd);
    if (cs.size() != 2 || cs[1].scope != TableScope::Table || cs[1].op != OpKind::Delete ||
        cs[1].table_a != 1u || cs[1].table_b) {
      std::cerr << "surplus table should be deleted\n"; return 1;
    }
  }

  // Signatures follow normalization
  {
    docdiff::NormalizationPolicy p;
    if (docdiff::row_signature(row({"ACME  Pro"}), p) != docdiff::row_signature(row({"acme pro"}), p)) {
      std::cerr << "row signature ignores normalization\n"; return 1;
    }
    if (docdiff::row_signature(row({"a", "b"}), p) == docdiff::row_signature(row({"a b"}), p)) {
      std::cerr << "row signature ignores cell boundaries\n"; return 1;
    }
  }

  std::cout << "OK\n";
  return 0;
}
