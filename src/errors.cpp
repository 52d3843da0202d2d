#include "docdiff/errors.hpp"

#include <algorithm>
#include <sstream>

namespace docdiff {

std::string_view stage_name(Stage stage) {
  switch (stage) {
  case Stage::Validate:
    return "validate";
  case Stage::Schedule:
    return "schedule";
  case Stage::Text:
    return "text";
  case Stage::Table:
    return "table";
  case Stage::Image:
    return "image";
  case Stage::Assemble:
    return "assemble";
  case Stage::Merge:
    return "merge";
  case Stage::Config:
    return "config";
  }
  return "?";
}

static std::string describe(const std::vector<PageFailure> &failures) {
  std::ostringstream os;
  os << "comparison incomplete: " << failures.size() << " page(s) failed";
  for (const auto &f : failures)
    os << "\n  page " << f.page << " [" << stage_name(f.stage) << "]: " << f.message;
  return os.str();
}

static std::vector<PageFailure> sorted(std::vector<PageFailure> failures) {
  std::ranges::stable_sort(failures, {}, &PageFailure::page);
  return failures;
}

PartialResult::PartialResult(std::vector<PageFailure> failures)
    : Error(failures.empty() ? Stage::Assemble : sorted(failures).front().stage,
            describe(sorted(failures))),
      failures_(sorted(std::move(failures))) {}

std::vector<std::size_t> PartialResult::pages() const {
  std::vector<std::size_t> out;
  for (const auto &f : failures_)
    if (out.empty() || out.back() != f.page)
      out.push_back(f.page);
  return out;
}

} // namespace docdiff
