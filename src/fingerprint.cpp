#include "docdiff/fingerprint.hpp"

#include "docdiff/consts.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <array>
#include <bit>
#include <stdexcept>

namespace docdiff {

Fingerprint::Fingerprint(std::size_t width) : width_(width), words_((width + 63) / 64, 0) {}

bool Fingerprint::test(std::size_t bit) const {
  if (bit >= width_) {
    throw std::out_of_range("fingerprint: bit index out of range");
  }
  return ((words_[bit / 64] >> (bit % 64)) & 1U) != 0;
}

void Fingerprint::set(std::size_t bit, bool value) {
  if (bit >= width_) {
    throw std::out_of_range("fingerprint: bit index out of range");
  }
  const std::uint64_t mask = std::uint64_t{1} << (bit % 64);
  if (value)
    words_[bit / 64] |= mask;
  else
    words_[bit / 64] &= ~mask;
}

std::string Fingerprint::to_hex() const {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  const std::size_t pad = (4 - width_ % 4) % 4;
  const std::size_t total = width_ + pad;
  std::string s;
  s.reserve(total / 4);
  for (std::size_t n = 0; n < total; n += 4) {
    unsigned v = 0;
    for (std::size_t k = 0; k < 4; ++k) {
      const std::size_t pos = n + k;
      const bool on = pos >= pad && test(pos - pad);
      v = (v << 1) | (on ? 1U : 0U);
    }
    s.push_back(kHex[v]);
  }
  return s;
}

bool from_hex(std::string_view hex, Fingerprint &out) {
  if (hex.empty()) {
    return false;
  }
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
      return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
      return 10 + (c - 'A');
    }
    return -1;
  };
  Fingerprint fp(hex.size() * 4);
  for (std::size_t i = 0; i < hex.size(); ++i) {
    const int v = nibble(hex[i]);
    if (v < 0) {
      return false;
    }
    for (std::size_t k = 0; k < 4; ++k) {
      fp.set((4 * i) + k, ((v >> (3 - k)) & 1) != 0);
    }
  }
  out = std::move(fp);
  return true;
}

std::size_t hamming(const Fingerprint &a, const Fingerprint &b) {
  if (a.width_ != b.width_) {
    throw std::invalid_argument("hamming: fingerprint widths differ (" + std::to_string(a.width_) +
                                " vs " + std::to_string(b.width_) + ")");
  }
  std::size_t n = 0;
  for (std::size_t i = 0; i < a.words_.size(); ++i)
    n += static_cast<std::size_t>(std::popcount(a.words_[i] ^ b.words_[i]));
  return n;
}

namespace {

// Single-channel 8-bit view of the buffer (ITU-R 601-2 luma for colour).
cv::Mat to_gray(const PixelBuffer &px) {
  const int type = px.channels == 1 ? CV_8UC1 : px.channels == 3 ? CV_8UC3 : CV_8UC4;
  const cv::Mat view(static_cast<int>(px.height), static_cast<int>(px.width), type,
                     const_cast<std::uint8_t *>(px.data.data()));
  cv::Mat gray;
  if (px.channels == 1)
    gray = view.clone();
  else
    cv::cvtColor(view, gray, px.channels == 3 ? cv::COLOR_RGB2GRAY : cv::COLOR_RGBA2GRAY);
  return gray;
}

} // namespace

Fingerprint compute_phash(const PixelBuffer &pixels) {
  if (pixels.width == 0 || pixels.height == 0) {
    throw std::invalid_argument("compute_phash: empty image");
  }
  if (pixels.channels != 1 && pixels.channels != 3 && pixels.channels != 4) {
    throw std::invalid_argument("compute_phash: unsupported channel count " +
                                std::to_string(pixels.channels));
  }
  if (pixels.data.size() != pixels.width * pixels.height * pixels.channels) {
    throw std::invalid_argument("compute_phash: pixel buffer size does not match dimensions");
  }

  constexpr int N = static_cast<int>(consts::kHashSampleSide);
  constexpr int K = static_cast<int>(consts::kHashSide);

  cv::Mat small;
  cv::resize(to_gray(pixels), small, cv::Size(N, N), 0, 0, cv::INTER_AREA);
  cv::Mat sample;
  small.convertTo(sample, CV_32F);
  cv::Mat freq;
  cv::dct(sample, freq);

  // low-frequency block, row = vertical frequency
  std::vector<float> low;
  low.reserve(consts::kHashBits);
  for (int j = 0; j < K; ++j)
    for (int k = 0; k < K; ++k)
      low.push_back(freq.at<float>(j, k));

  std::vector<float> sorted = low;
  std::ranges::sort(sorted);
  const double median =
      (static_cast<double>(sorted[(K * K / 2) - 1]) + static_cast<double>(sorted[K * K / 2])) / 2.0;

  Fingerprint fp(consts::kHashBits);
  for (std::size_t i = 0; i < low.size(); ++i)
    fp.set(i, static_cast<double>(low[i]) > median);
  return fp;
}

} // namespace docdiff
