#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace docdiff {

// 8-bit interleaved pixels, row-major. channels: 1 (gray), 3 (RGB) or 4 (RGBA).
struct PixelBuffer {
  std::size_t width = 0;
  std::size_t height = 0;
  std::size_t channels = 1;
  std::vector<std::uint8_t> data;
};

/**
 * Fixed-width bit vector summarizing an image.
 * Bit i is the i-th coefficient in row-major order. The hex form packs
 * bits most-significant first, left-padded to a whole nibble.
 */
class Fingerprint {
public:
  Fingerprint() = default;
  explicit Fingerprint(std::size_t width);

  [[nodiscard]] std::size_t width() const { return width_; }
  [[nodiscard]] bool test(std::size_t bit) const;
  void set(std::size_t bit, bool value);

  [[nodiscard]] std::string to_hex() const;

  bool operator==(const Fingerprint &other) const = default;

private:
  friend std::size_t hamming(const Fingerprint &a, const Fingerprint &b);

  std::size_t width_ = 0;
  std::vector<std::uint64_t> words_;
};

/**
 * Parse a hex fingerprint (width = 4 * hex.size()).
 * Returns false if the string is empty or has non-hex characters.
 */
bool from_hex(std::string_view hex, Fingerprint &out);

// Count of differing bits. Throws std::invalid_argument on width mismatch.
std::size_t hamming(const Fingerprint &a, const Fingerprint &b);

// DCT perceptual hash (64 bits). Throws std::invalid_argument on an empty
// or inconsistent buffer.
Fingerprint compute_phash(const PixelBuffer &pixels);

} // namespace docdiff
