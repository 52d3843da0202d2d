#include "docdiff/model.hpp"

#include <algorithm>
#include <stdexcept>

namespace docdiff {

std::size_t Table::cell_count() const {
  std::size_t n = 0;
  for (const auto &row : rows)
    n += row.size();
  return n;
}

static BBox row_band(const Table &table, std::size_t row) {
  const double rh = table.box.height() / static_cast<double>(table.rows.size());
  const double top = table.box.y0 + rh * static_cast<double>(row);
  return BBox{.x0 = table.box.x0, .y0 = top, .x1 = table.box.x1, .y1 = top + rh};
}

BBox cell_box(const Table &table, std::size_t row, std::size_t col) {
  if (row >= table.rows.size() || col >= table.rows[row].size()) {
    throw std::out_of_range("cell_box: no such cell");
  }
  const Cell &cell = table.rows[row][col];
  if (cell.box)
    return *cell.box;
  BBox band = row_band(table, row);
  const double cw = band.width() / static_cast<double>(table.rows[row].size());
  band.x0 = table.box.x0 + cw * static_cast<double>(col);
  band.x1 = band.x0 + cw;
  return band;
}

BBox row_box(const Table &table, std::size_t row) {
  if (row >= table.rows.size()) {
    throw std::out_of_range("row_box: no such row");
  }
  const Row &cells = table.rows[row];
  if (cells.empty())
    return row_band(table, row);
  BBox out = cell_box(table, row, 0);
  for (std::size_t c = 1; c < cells.size(); ++c) {
    const BBox b = cell_box(table, row, c);
    out.x0 = std::min(out.x0, b.x0);
    out.y0 = std::min(out.y0, b.y0);
    out.x1 = std::max(out.x1, b.x1);
    out.y1 = std::max(out.y1, b.y1);
  }
  return out;
}

Image::Image(BBox box, PixelBuffer pixels)
    : box_(box), pixels_(std::make_shared<const PixelBuffer>(std::move(pixels))),
      memo_(std::make_shared<Memo>()) {}

Image::Image(BBox box, Fingerprint fingerprint) : box_(box), memo_(std::make_shared<Memo>()) {
  if (fingerprint.width() == 0) {
    throw std::invalid_argument("image fingerprint has no bits");
  }
  std::call_once(memo_->once, [&] { memo_->value = std::move(fingerprint); });
}

const Fingerprint &Image::fingerprint() const {
  std::call_once(memo_->once, [this] {
    if (!pixels_) {
      throw std::invalid_argument("image has neither pixels nor a fingerprint");
    }
    memo_->value = compute_phash(*pixels_);
  });
  return memo_->value;
}

} // namespace docdiff
