#pragma once
#include "docdiff/config.hpp"
#include "docdiff/hash.hpp"
#include "docdiff/model.hpp"
#include "docdiff/result.hpp"

#include <cstddef>
#include <span>

namespace docdiff {

// Content signature of a token sequence (tokens joined by a unit separator).
Digest token_signature(const Tokens &tokens);

// Diff the text blocks of one page pair; appends one TextChange per block
// (matched pairs share a record). Either side may be empty (missing page).
void diff_text(std::span<const TextBlock> a, std::span<const TextBlock> b, std::size_t page,
               const Options &options, PageDiff &out);

} // namespace docdiff
