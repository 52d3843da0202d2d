#pragma once
#include "docdiff/config.hpp"
#include "docdiff/hash.hpp"
#include "docdiff/model.hpp"
#include "docdiff/result.hpp"

#include <cstddef>
#include <span>

namespace docdiff {

// SHA-1 over the row's normalized cell tokens and merged-span flags.
Digest row_signature(const Row &row, const NormalizationPolicy &policy);

// Diff one table pair: rows aligned by signature (matched-but-modified
// above options.row_similarity_threshold), matched rows diffed per cell.
void diff_table(const Table &a, const Table &b, std::size_t page, std::size_t index_a,
                std::size_t index_b, const Options &options, PageDiff &out);

// Pair the tables of one page by position; surplus tables become whole-table
// Insert/Delete records.
void diff_tables(std::span<const Table> a, std::span<const Table> b, std::size_t page,
                 const Options &options, PageDiff &out);

} // namespace docdiff
