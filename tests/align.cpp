#include "docdiff/align.hpp"
#include "docdiff/detail/myers.hpp"

#include <cmath>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using docdiff::align;
using docdiff::AlignOptions;
using docdiff::OpKind;
using docdiff::Tokens;

static bool contains(const std::string &hay, const std::string &needle) {
  return hay.find(needle) != std::string::npos;
}

static bool near(double x, double y) { return std::fabs(x - y) < 1e-9; }

static Tokens numbered(std::size_t n) {
  Tokens t;
  for (std::size_t i = 0; i < n; ++i)
    t.push_back("t" + std::to_string(i));
  return t;
}

int main() {
  // Unified rendering over lines
  {
    auto a = docdiff::split_lines("line1\nline2\nline3\n");
    auto b = docdiff::split_lines("line1\nlineZ\nline3\nline4\n");
    auto ud = docdiff::unified_diff(a, b, "demo.txt");
    if (!contains(ud, "--- a/demo.txt")) { std::cerr << "missing header\n"; return 1; }
    if (!contains(ud, "+++ b/demo.txt")) { std::cerr << "missing header2\n"; return 1; }
    if (!contains(ud, "@@ -1,3 +1,4 @@")) { std::cerr << "bad hunk header:\n" << ud; return 1; }
    if (!contains(ud, "-line2")) { std::cerr << "missing deletion\n"; return 1; }
    if (!contains(ud, "+lineZ")) { std::cerr << "missing addition\n"; return 1; }
    if (!contains(ud, "+line4")) { std::cerr << "missing trailing addition\n"; return 1; }
    if (!docdiff::unified_diff(a, a, "same.txt").empty()) { std::cerr << "identical input rendered a diff\n"; return 1; }
  }

  // Identical sequences
  {
    const Tokens t = {"width:", "10mm"};
    auto al = align(t, t);
    if (!al.identical() || !near(al.similarity, 1.0) || !al.hunks.empty() || al.degraded) {
      std::cerr << "identical tokens not reported as equal\n"; return 1;
    }
    auto empty = align({}, {});
    if (!empty.identical() || !near(empty.similarity, 1.0)) { std::cerr << "empty vs empty\n"; return 1; }
  }

  // Pure insertion is not a degradation
  {
    auto al = align({}, {"a", "b"});
    if (al.degraded || al.runs.size() != 1 || al.runs[0].op != OpKind::Insert || al.runs[0].b_len != 2) {
      std::cerr << "empty vs tokens should be one insert run\n"; return 1;
    }
    if (!near(al.similarity, 0.0)) { std::cerr << "insert-only similarity\n"; return 1; }
  }

  // Disjoint content degrades to one replace over everything
  {
    auto al = align({"a", "b", "c"}, {"x", "y"});
    if (!al.degraded || al.runs.size() != 1) { std::cerr << "disjoint input should degrade\n"; return 1; }
    const auto &r = al.runs[0];
    if (r.op != OpKind::Replace || r.a_pos != 0 || r.a_len != 3 || r.b_pos != 0 || r.b_len != 2) {
      std::cerr << "degraded run must span both sequences\n"; return 1;
    }
  }

  // Delete+insert of comparable length coalesce with character similarity
  {
    auto al = align({"width:", "10mm"}, {"width:", "12mm"});
    if (al.runs.size() != 2 || al.runs[0].op != OpKind::Equal || al.runs[1].op != OpKind::Replace) {
      std::cerr << "expected equal + replace\n"; return 1;
    }
    if (!near(al.runs[1].similarity, 0.75)) { std::cerr << "replace similarity " << al.runs[1].similarity << "\n"; return 1; }
    if (!near(al.similarity, 0.5)) { std::cerr << "alignment similarity " << al.similarity << "\n"; return 1; }
  }

  // ...but not when lengths are far apart
  {
    auto al = align({"k", "a"}, {"k", "x", "y", "z"});
    bool has_del = false, has_ins = false;
    for (const auto &r : al.runs) {
      if (r.op == OpKind::Replace) { std::cerr << "uneven runs must not coalesce\n"; return 1; }
      has_del |= r.op == OpKind::Delete;
      has_ins |= r.op == OpKind::Insert;
    }
    if (!has_del || !has_ins) { std::cerr << "expected separate delete and insert\n"; return 1; }
  }

  // Equal run nearest the start is as long as possible
  {
    auto al = align({"k", "a", "b", "a", "b"}, {"k", "a", "b"});
    if (al.runs.front().op != OpKind::Equal || al.runs.front().a_len != 3) {
      std::cerr << "leading equal run not maximal\n"; return 1;
    }
    const Tokens a = {"q", "a", "q"};
    const Tokens b = {"q"};
    std::vector<char> ops = {'-', '-', '='};
    docdiff::detail::shift_boundaries<std::string>(a, b, ops);
    if (ops != std::vector<char>{'=', '-', '-'}) { std::cerr << "boundary shift failed\n"; return 1; }
  }

  // Context groups changes into hunks
  {
    Tokens a = numbered(20);
    Tokens b = a;
    b[5] = "changed5";
    b[15] = "changed15";
    auto narrow = align(a, b, AlignOptions{.context = 3});
    if (narrow.hunks.size() != 2) { std::cerr << "expected two hunks, got " << narrow.hunks.size() << "\n"; return 1; }
    if (narrow.hunks[0].a_pos != 2 || narrow.hunks[0].a_len != 7) { std::cerr << "first hunk bounds\n"; return 1; }
    auto wide = align(a, b, AlignOptions{.context = 5});
    if (wide.hunks.size() != 1) { std::cerr << "expected hunks to merge\n"; return 1; }
    auto none = align(a, b, AlignOptions{.context = 0});
    if (none.hunks.size() != 2 || none.hunks[0].runs.size() != 1) { std::cerr << "zero context\n"; return 1; }
  }

  // Cost bound degrades instead of failing
  {
    auto al = align({"a", "b", "c", "d"}, {"a", "x", "c", "y"}, AlignOptions{.max_cost = 1});
    if (!al.degraded || al.runs.size() != 1 || al.runs[0].op != OpKind::Replace) {
      std::cerr << "cost bound should degrade\n"; return 1;
    }
    if (!near(al.similarity, 0.5)) { std::cerr << "degraded similarity estimate\n"; return 1; }
  }

  // Symmetric similarity
  {
    const Tokens a = {"brand", "acme", "pro", "tool"};
    const Tokens b = {"brand", "acme", "tool", "kit", "x"};
    if (!near(align(a, b).similarity, align(b, a).similarity)) { std::cerr << "similarity not symmetric\n"; return 1; }
    if (!near(docdiff::char_similarity(a, b), docdiff::char_similarity(b, a))) {
      std::cerr << "char similarity not symmetric\n"; return 1;
    }
  }

  // Long output is truncated around a marker
  {
    Tokens a = numbered(40);
    Tokens b;
    for (const auto &t : a)
      b.push_back(t + "x");
    auto ud = docdiff::unified_diff(a, b, "long.txt", 3, 6);
    if (!contains(ud, "... (diff truncated) ...")) { std::cerr << "missing truncation marker\n"; return 1; }
    std::istringstream is(ud);
    std::string line;
    int n = 0;
    while (std::getline(is, line))
      ++n;
    if (n != 7) { std::cerr << "truncated diff has " << n << " lines\n"; return 1; }
  }

  std::cout << "OK\n";
  return 0;
}
