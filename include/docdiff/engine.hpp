#pragma once
#include "docdiff/config.hpp"
#include "docdiff/model.hpp"
#include "docdiff/result.hpp"

#include <cstddef>
#include <stop_token>

namespace docdiff {

// Throws StructuralMismatch if a document has no pages or its page indices
// are not 0..n-1 in order.
void validate_documents(const Document &a, const Document &b);

// Text, table and image diff of one page pair; either page may be null.
// Failures surface as Error tagged with the stage that raised them.
PageDiff diff_page(const Page *a, const Page *b, std::size_t page, const Options &options);

/**
 * Compare two documents. Page pairs are diffed on up to
 * options.parallelism worker threads; all workers are joined before the
 * records are assembled and audited for coverage.
 *
 * Throws StructuralMismatch, ConfigError, PartialResult (any page failed
 * or `stop` was requested before every page ran) or Error(Stage::Assemble).
 */
DiffResult compare(const Document &a, const Document &b, const Options &options = {},
                   std::stop_token stop = {});

} // namespace docdiff
