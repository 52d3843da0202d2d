#pragma once
#include <cstddef>
#include <string_view>

namespace docdiff::consts {

// Alignment defaults
inline constexpr std::size_t kContextSize = 3;          // tokens shown around a change
inline constexpr std::size_t kMaxAlignmentCost = 2000;  // Myers D bound before degrading
inline constexpr double kComparableRunRatio = 0.5;      // shorter/longer for delete+insert -> replace

// Matching thresholds
inline constexpr double kRowSimilarity = 0.6;
inline constexpr double kBlockSimilarity = 0.6;
inline constexpr double kImageDistanceFraction = 0.10; // of fingerprint bit width

// Perceptual hash
inline constexpr std::size_t kHashSide = 8;                        // 8x8 low-frequency block
inline constexpr std::size_t kHashBits = kHashSide * kHashSide;    // 64-bit fingerprint
inline constexpr std::size_t kHashSampleSide = kHashSide * 4;      // 32x32 resample before DCT

// Unified diff rendering
inline constexpr std::size_t kMaxDiffLines = 60;
inline constexpr std::string_view kTruncatedMarker = "... (diff truncated) ...";

// Row / block signatures
inline constexpr char kTokenSep = '\x1f';
inline constexpr char kCellSep = '\x1e';

} // namespace docdiff::consts
