#pragma once
#include "docdiff/fingerprint.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace docdiff {

// Page coordinates in points, origin top-left, y grows downward.
struct BBox {
  double x0 = 0;
  double y0 = 0;
  double x1 = 0;
  double y1 = 0;

  [[nodiscard]] double width() const { return x1 - x0; }
  [[nodiscard]] double height() const { return y1 - y0; }
  bool operator==(const BBox &) const = default;
};

struct PageSize {
  double width = 0;
  double height = 0;
};

struct TextBlock {
  std::string text; // raw extracted text, tokenized on demand
  BBox box;
};

struct Cell {
  std::string text;
  bool merged_span = false;
  std::optional<BBox> box; // derived from the table grid when absent
};

using Row = std::vector<Cell>;

struct Table {
  std::vector<Row> rows; // column count may differ per row
  BBox box;

  [[nodiscard]] std::size_t cell_count() const;
};

// Geometry of cell (row, col); uses the cell's own box when it has one.
BBox cell_box(const Table &table, std::size_t row, std::size_t col);
// Union of the row's cell boxes.
BBox row_box(const Table &table, std::size_t row);

/**
 * Embedded image. Holds pixels and/or an extractor-provided fingerprint.
 * The fingerprint is computed at most once, on first request, and shared
 * by copies of the same Image. A zero-width fingerprint is rejected with
 * std::invalid_argument.
 */
class Image {
public:
  Image(BBox box, PixelBuffer pixels);
  Image(BBox box, Fingerprint fingerprint);

  [[nodiscard]] const BBox &box() const { return box_; }
  [[nodiscard]] bool has_pixels() const { return pixels_ != nullptr; }
  [[nodiscard]] const Fingerprint &fingerprint() const;

private:
  struct Memo {
    std::once_flag once;
    Fingerprint value;
  };

  BBox box_;
  std::shared_ptr<const PixelBuffer> pixels_;
  std::shared_ptr<Memo> memo_;
};

struct Page {
  std::size_t index = 0;
  PageSize size;
  std::vector<TextBlock> blocks;
  std::vector<Table> tables;
  std::vector<Image> images;
};

struct Document {
  std::string label; // source path or display name
  std::vector<Page> pages;
};

} // namespace docdiff
