#pragma once
#include "docdiff/model.hpp"
#include "docdiff/result.hpp"

#include <string>
#include <vector>

namespace docdiff {

// Merge per-page records into one result ordered by (page, top of the
// record's first present box, kind priority); page-local order breaks ties.
DiffResult assemble(std::vector<PageDiff> pages);

// Describe every element of either document that is covered zero or several
// times, and every record pointing at a missing element. Empty when sound.
std::vector<std::string> audit_coverage(const Document &a, const Document &b,
                                        const DiffResult &result);

// Canonical text dump; identical results give identical bytes.
std::string format_result(const DiffResult &result);

} // namespace docdiff
