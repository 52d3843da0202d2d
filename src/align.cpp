#include "docdiff/align.hpp"

#include "docdiff/detail/myers.hpp"

#include <algorithm>
#include <sstream>

namespace docdiff {

std::string_view op_name(OpKind op) {
  switch (op) {
  case OpKind::Equal:
    return "equal";
  case OpKind::Insert:
    return "insert";
  case OpKind::Delete:
    return "delete";
  case OpKind::Replace:
    return "replace";
  }
  return "?";
}

bool Alignment::identical() const {
  return std::ranges::all_of(runs, [](const Run &r) { return r.op == OpKind::Equal; });
}

static std::string join(const Tokens &tokens) {
  std::string s;
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    if (i)
      s.push_back(' ');
    s += tokens[i];
  }
  return s;
}

static Tokens slice(const Tokens &t, std::size_t pos, std::size_t len) {
  return Tokens(t.begin() + static_cast<std::ptrdiff_t>(pos),
                t.begin() + static_cast<std::ptrdiff_t>(pos + len));
}

double char_similarity(const Tokens &a, const Tokens &b, std::size_t max_cost) {
  const std::string x = join(a);
  const std::string y = join(b);
  const std::size_t longest = std::max(x.size(), y.size());
  if (longest == 0)
    return 1.0;
  const std::span<const char> sx(x.data(), x.size());
  const std::span<const char> sy(y.data(), y.size());
  std::size_t matched;
  if (auto ops = detail::edit_ops<char>(sx, sy, max_cost); ops) {
    matched = static_cast<std::size_t>(std::ranges::count(*ops, '='));
  } else {
    matched = detail::common_count<char>(sx, sy);
  }
  return static_cast<double>(matched) / static_cast<double>(longest);
}

static bool comparable(std::size_t x, std::size_t y) {
  const auto lo = static_cast<double>(std::min(x, y));
  const auto hi = static_cast<double>(std::max(x, y));
  return lo >= consts::kComparableRunRatio * hi;
}

static std::vector<Run> build_runs(const std::vector<char> &ops, const Tokens &a, const Tokens &b,
                                   std::size_t max_cost) {
  std::vector<Run> raw;
  std::size_t ia = 0, ib = 0;
  for (std::size_t i = 0; i < ops.size();) {
    const char c = ops[i];
    std::size_t j = i;
    while (j < ops.size() && ops[j] == c)
      ++j;
    const std::size_t n = j - i;
    if (c == '=') {
      raw.push_back(Run{OpKind::Equal, ia, n, ib, n, 1.0});
      ia += n;
      ib += n;
    } else if (c == '-') {
      raw.push_back(Run{OpKind::Delete, ia, n, ib, 0, 0.0});
      ia += n;
    } else {
      raw.push_back(Run{OpKind::Insert, ia, 0, ib, n, 0.0});
      ib += n;
    }
    i = j;
  }

  // delete+insert neighbours of comparable length become one Replace
  std::vector<Run> runs;
  runs.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (i + 1 < raw.size()) {
      const Run &x = raw[i];
      const Run &y = raw[i + 1];
      const bool pair = (x.op == OpKind::Delete && y.op == OpKind::Insert) ||
                        (x.op == OpKind::Insert && y.op == OpKind::Delete);
      if (pair) {
        const Run &del = x.op == OpKind::Delete ? x : y;
        const Run &ins = x.op == OpKind::Insert ? x : y;
        if (comparable(del.a_len, ins.b_len)) {
          const double sim = char_similarity(slice(a, del.a_pos, del.a_len),
                                             slice(b, ins.b_pos, ins.b_len), max_cost);
          runs.push_back(Run{OpKind::Replace, del.a_pos, del.a_len, ins.b_pos, ins.b_len, sim});
          ++i;
          continue;
        }
      }
    }
    runs.push_back(raw[i]);
  }
  return runs;
}

static Run clip_equal(const Run &r, std::size_t n, bool tail) {
  n = std::min(n, r.a_len);
  if (tail)
    return Run{OpKind::Equal, r.a_pos + r.a_len - n, n, r.b_pos + r.b_len - n, n, 1.0};
  return Run{OpKind::Equal, r.a_pos, n, r.b_pos, n, 1.0};
}

static std::vector<Hunk> make_hunks(const std::vector<Run> &runs, std::size_t context) {
  std::vector<Hunk> hunks;
  std::size_t i = 0;
  while (i < runs.size()) {
    if (runs[i].op == OpKind::Equal) {
      ++i;
      continue;
    }
    Hunk h{};
    if (i > 0 && context > 0)
      h.runs.push_back(clip_equal(runs[i - 1], context, true));
    std::size_t j = i;
    while (j < runs.size()) {
      const Run &r = runs[j];
      if (r.op != OpKind::Equal || (j + 1 < runs.size() && r.a_len <= 2 * context)) {
        h.runs.push_back(r);
        ++j;
        continue;
      }
      if (context > 0)
        h.runs.push_back(clip_equal(r, context, false));
      ++j;
      break;
    }
    const Run &first = h.runs.front();
    const Run &last = h.runs.back();
    h.a_pos = first.a_pos;
    h.b_pos = first.b_pos;
    h.a_len = last.a_pos + last.a_len - first.a_pos;
    h.b_len = last.b_pos + last.b_len - first.b_pos;
    hunks.push_back(std::move(h));
    i = j;
  }
  return hunks;
}

Alignment align(const Tokens &a, const Tokens &b, const AlignOptions &options) {
  Alignment out;
  const std::size_t longest = std::max(a.size(), b.size());
  auto ops = detail::edit_ops<std::string>(a, b, options.max_cost);

  if (ops) {
    out.matched = static_cast<std::size_t>(std::ranges::count(*ops, '='));
  } else {
    out.matched = detail::common_count<std::string>(a, b);
  }
  out.similarity =
      longest == 0 ? 1.0 : static_cast<double>(out.matched) / static_cast<double>(longest);

  const bool disjoint = ops && out.matched == 0 && !a.empty() && !b.empty();
  if (!ops || disjoint) {
    out.degraded = true;
    out.runs.push_back(
        Run{OpKind::Replace, 0, a.size(), 0, b.size(), char_similarity(a, b, options.max_cost)});
  } else {
    out.runs = build_runs(*ops, a, b, options.max_cost);
  }
  out.hunks = make_hunks(out.runs, options.context);
  return out;
}

Tokens split_lines(std::string_view text) {
  Tokens out;
  std::string cur;
  for (const char c : text) {
    if (c == '\n') {
      out.push_back(std::move(cur));
      cur.clear();
    } else if (c != '\r') {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) {
    out.push_back(std::move(cur));
  }
  return out;
}

// difflib-style "start,len" with 1-based start
static std::string unified_range(std::size_t pos, std::size_t len) {
  if (len == 1)
    return std::to_string(pos + 1);
  return std::to_string(len == 0 ? pos : pos + 1) + "," + std::to_string(len);
}

std::string unified_diff(const Tokens &a, const Tokens &b, std::string_view label,
                         std::size_t context, std::size_t max_lines) {
  const Alignment al = align(a, b, AlignOptions{.context = context});
  if (al.hunks.empty()) {
    return {};
  }

  std::vector<std::string> lines;
  lines.push_back("--- a/" + std::string(label));
  lines.push_back("+++ b/" + std::string(label));
  for (const auto &h : al.hunks) {
    lines.push_back("@@ -" + unified_range(h.a_pos, h.a_len) + " +" +
                    unified_range(h.b_pos, h.b_len) + " @@");
    for (const auto &r : h.runs) {
      if (r.op == OpKind::Equal) {
        for (std::size_t k = 0; k < r.a_len; ++k)
          lines.push_back(' ' + a[r.a_pos + k]);
        continue;
      }
      for (std::size_t k = 0; k < r.a_len; ++k)
        lines.push_back('-' + a[r.a_pos + k]);
      for (std::size_t k = 0; k < r.b_len; ++k)
        lines.push_back('+' + b[r.b_pos + k]);
    }
  }

  if (max_lines > 0 && lines.size() > max_lines) {
    std::vector<std::string> kept(lines.begin(), lines.begin() + (max_lines / 2));
    kept.emplace_back(consts::kTruncatedMarker);
    kept.insert(kept.end(), lines.end() - ((max_lines + 1) / 2), lines.end());
    lines = std::move(kept);
  }

  std::ostringstream out;
  for (const auto &l : lines)
    out << l << "\n";
  return out.str();
}

} // namespace docdiff
