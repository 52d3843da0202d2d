#pragma once
#include <algorithm>
#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <vector>

// Generic Myers O(ND) edit ops shared by the token, character and unit
// aligners. Ops: '=' keep, '-' delete from a, '+' insert from b.
namespace docdiff::detail {

template <typename T>
bool myers(std::span<const T> a, std::span<const T> b, std::size_t max_cost,
           std::vector<char> &ops) {
  const int N = static_cast<int>(a.size());
  const int M = static_cast<int>(b.size());
  const int MAX = N + M;
  if (N == 0 || M == 0) {
    ops.assign(static_cast<std::size_t>(N), '-');
    ops.insert(ops.end(), static_cast<std::size_t>(M), '+');
    return true;
  }
  const int limit = std::min(MAX, static_cast<int>(std::min<std::size_t>(max_cost, MAX)));
  const int OFFSET = MAX + 1;
  std::vector<int> v((2 * MAX) + 3, 0);
  // trace[d] holds v[-d-1 .. d+1] as it was before exploring layer d
  std::vector<std::vector<int>> trace;
  trace.reserve(limit + 1);

  for (int d = 0; d <= limit; ++d) {
    trace.emplace_back(v.begin() + (OFFSET - d - 1), v.begin() + (OFFSET + d + 2));
    for (int k = -d; k <= d; k += 2) {
      int x;
      if (k == -d || (k != d && v[OFFSET + k - 1] < v[OFFSET + k + 1])) {
        x = v[OFFSET + k + 1];     // down (insertion)
      } else {
        x = v[OFFSET + k - 1] + 1; // right (deletion)
      }
      int y = x - k;
      while (x < N && y < M && a[x] == b[y]) { ++x; ++y; }
      v[OFFSET + k] = x;
      if (x < N || y < M) {
        continue;
      }
      std::vector<char> rev_ops;
      int cx = N, cy = M;
      for (int dd = d; dd >= 0; --dd) {
        const auto &snap = trace[dd];
        auto at = [&](int kk) { return snap[kk + dd + 1]; };
        const int kk = cx - cy;
        bool down;
        int prev_k;
        if (kk == -dd || (kk != dd && at(kk - 1) < at(kk + 1))) {
          prev_k = kk + 1; down = true;
        } else { prev_k = kk - 1; down = false; }
        const int px = at(prev_k);
        const int py = px - prev_k;
        const int sx = down ? px : px + 1; // snake start
        const int sy = down ? py + 1 : py;
        while (cx > sx && cy > sy) { rev_ops.push_back('='); --cx; --cy; }
        if (dd > 0) rev_ops.push_back(down ? '+' : '-');
        cx = px; cy = py;
      }
      ops.assign(rev_ops.rbegin(), rev_ops.rend());
      return true;
    }
  }
  return false;
}

// Slide homogeneous edit runs toward the end while the element after the
// run equals its first element, so equal runs near the start grow.
template <typename T>
void shift_boundaries(std::span<const T> a, std::span<const T> b, std::vector<char> &ops) {
  bool changed = true;
  while (changed) {
    changed = false;
    std::size_t ia = 0, ib = 0, i = 0;
    while (i < ops.size()) {
      const char c = ops[i];
      if (c == '=') {
        ++ia; ++ib; ++i;
        continue;
      }
      std::size_t j = i;
      while (j < ops.size() && ops[j] == c)
        ++j;
      const std::size_t len = j - i;
      // keep sliding this run while possible
      while (j < ops.size() && ops[j] == '=' &&
             (c == '-' ? a[ia] == a[ia + len] : b[ib] == b[ib + len])) {
        ops[i] = '=';
        ops[j] = c;
        ++ia; ++ib; ++i; ++j;
        changed = true;
      }
      if (c == '-') ia += len; else ib += len;
      i = j;
    }
  }
}

// Full pipeline: common prefix/suffix, Myers on the middle, boundary shifting.
// Returns nullopt when the middle needs more than max_cost edits.
template <typename T>
std::optional<std::vector<char>> edit_ops(std::span<const T> a, std::span<const T> b,
                                          std::size_t max_cost) {
  std::size_t pre = 0;
  while (pre < a.size() && pre < b.size() && a[pre] == b[pre])
    ++pre;
  std::size_t suf = 0;
  while (suf < a.size() - pre && suf < b.size() - pre &&
         a[a.size() - 1 - suf] == b[b.size() - 1 - suf])
    ++suf;

  std::vector<char> mid;
  if (!myers(a.subspan(pre, a.size() - pre - suf), b.subspan(pre, b.size() - pre - suf), max_cost,
             mid)) {
    return std::nullopt;
  }
  std::vector<char> ops(pre, '=');
  ops.insert(ops.end(), mid.begin(), mid.end());
  ops.insert(ops.end(), suf, '=');
  shift_boundaries(a, b, ops);
  return ops;
}

// Multiset intersection size; an upper bound of the LCS used when the exact
// alignment is too costly.
template <typename T>
std::size_t common_count(std::span<const T> a, std::span<const T> b) {
  std::map<T, std::size_t> bag;
  for (const auto &x : a)
    ++bag[x];
  std::size_t n = 0;
  for (const auto &y : b) {
    auto it = bag.find(y);
    if (it != bag.end() && it->second > 0) {
      --it->second;
      ++n;
    }
  }
  return n;
}

} // namespace docdiff::detail
