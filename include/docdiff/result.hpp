#pragma once
#include "docdiff/align.hpp"
#include "docdiff/model.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace docdiff {

struct Location {
  std::size_t page = 0;
  BBox box;
  bool operator==(const Location &) const = default;
};

// Fields shared by every change kind. A side's location is absent when the
// element does not exist there (pure insert/delete).
struct ChangeBase {
  OpKind op = OpKind::Equal;
  std::optional<Location> a;
  std::optional<Location> b;
  double similarity = 1.0;
};

struct TextChange : ChangeBase {
  std::optional<std::size_t> block_a;
  std::optional<std::size_t> block_b;
  std::vector<Run> runs;   // token-level edit script (matched blocks only)
  std::vector<Hunk> hunks; // runs with context
};

enum class TableScope : std::uint8_t {
  Table,  // whole table inserted/deleted (count mismatch or empty counterpart)
  Row,    // unmatched row
  Column, // trailing cell of a matched row with more columns
  Cell,   // cell of a matched row pair
};

std::string_view scope_name(TableScope scope);

struct TableChange : ChangeBase {
  TableScope scope = TableScope::Cell;
  std::optional<std::size_t> table_a;
  std::optional<std::size_t> table_b;
  std::optional<std::size_t> row_a;
  std::optional<std::size_t> row_b;
  std::optional<std::size_t> column_a;
  std::optional<std::size_t> column_b;
  bool span_changed = false; // merged-span flag differs on a matched cell
  std::vector<Run> runs;     // token-level edit script (Cell scope only)
  std::vector<Hunk> hunks;
};

struct ImageChange : ChangeBase {
  std::optional<std::size_t> image_a;
  std::optional<std::size_t> image_b;
  std::size_t distance = 0; // Hamming distance for matched pairs
};

// Closed set of change kinds; the alternative order is the kind priority
// used to order ties (text before table before image).
using ChangeRecord = std::variant<TextChange, TableChange, ImageChange>;

inline const ChangeBase &base_of(const ChangeRecord &rec) {
  return std::visit([](const auto &c) -> const ChangeBase & { return c; }, rec);
}

// Per-page output of the text, table and image differs.
struct PageDiff {
  std::size_t page = 0;
  std::vector<ChangeRecord> records;
  std::size_t degraded = 0;
};

struct DiffResult {
  std::vector<ChangeRecord> records;
  std::size_t degraded_alignments = 0;

  [[nodiscard]] std::size_t count(OpKind op) const;
};

} // namespace docdiff
