#include "docdiff/engine.hpp"

#include "docdiff/assemble.hpp"
#include "docdiff/errors.hpp"
#include "docdiff/image_match.hpp"
#include "docdiff/log.hpp"
#include "docdiff/table_diff.hpp"
#include "docdiff/text_diff.hpp"

#include <algorithm>
#include <atomic>
#include <optional>
#include <span>
#include <thread>
#include <vector>

namespace docdiff {

static void validate_one(const Document &doc) {
  if (doc.pages.empty()) {
    throw StructuralMismatch("document '" + doc.label + "' has no pages");
  }
  for (std::size_t i = 0; i < doc.pages.size(); ++i) {
    if (doc.pages[i].index != i) {
      throw StructuralMismatch("document '" + doc.label + "': page at position " +
                               std::to_string(i) + " has index " +
                               std::to_string(doc.pages[i].index));
    }
  }
}

void validate_documents(const Document &a, const Document &b) {
  validate_one(a);
  validate_one(b);
}

template <typename Fn> static void run_stage(Stage stage, Fn &&fn) {
  try {
    fn();
  } catch (const Error &) {
    throw;
  } catch (const std::exception &e) {
    throw Error(stage, e.what());
  }
}

template <typename T>
static std::span<const T> items(const Page *p, std::vector<T> Page::*member) {
  if (!p)
    return {};
  return std::span<const T>(p->*member);
}

PageDiff diff_page(const Page *a, const Page *b, std::size_t page, const Options &options) {
  PageDiff out;
  out.page = page;
  run_stage(Stage::Text, [&] {
    diff_text(items(a, &Page::blocks), items(b, &Page::blocks), page, options, out);
  });
  run_stage(Stage::Table, [&] {
    diff_tables(items(a, &Page::tables), items(b, &Page::tables), page, options, out);
  });
  run_stage(Stage::Image, [&] {
    diff_images(items(a, &Page::images), items(b, &Page::images), page, options, out);
  });
  return out;
}

namespace {

// Joins every started worker, also when starting a later one throws.
struct WorkerPool {
  std::vector<std::thread> threads;
  ~WorkerPool() {
    for (auto &t : threads)
      if (t.joinable())
        t.join();
  }
};

} // namespace

DiffResult compare(const Document &a, const Document &b, const Options &options,
                   std::stop_token stop) {
  options.validate();
  validate_documents(a, b);

  const std::size_t total = std::max(a.pages.size(), b.pages.size());
  std::vector<std::optional<PageDiff>> slots(total);
  std::vector<std::optional<PageFailure>> failures(total);
  std::atomic<std::size_t> next{0};

  auto worker = [&] {
    for (;;) {
      const std::size_t p = next.fetch_add(1);
      if (p >= total)
        return;
      if (stop.stop_requested()) {
        failures[p] = PageFailure{p, Stage::Schedule, "cancelled before processing"};
        continue;
      }
      const Page *pa = p < a.pages.size() ? &a.pages[p] : nullptr;
      const Page *pb = p < b.pages.size() ? &b.pages[p] : nullptr;
      try {
        slots[p] = diff_page(pa, pb, p, options);
        log::debug("page " + std::to_string(p) + ": " + std::to_string(slots[p]->records.size()) +
                   " record(s)");
      } catch (const Error &e) {
        log::error("page " + std::to_string(p) + " [" + std::string(stage_name(e.stage())) +
                   "]: " + e.what());
        failures[p] = PageFailure{p, e.stage(), e.what()};
      } catch (const std::exception &e) {
        log::error("page " + std::to_string(p) + ": " + e.what());
        failures[p] = PageFailure{p, Stage::Schedule, e.what()};
      }
    }
  };

  {
    WorkerPool pool;
    const std::size_t n = std::min(options.parallelism, total);
    for (std::size_t i = 1; i < n; ++i)
      pool.threads.emplace_back(worker);
    worker(); // the calling thread is worker 0
  } // barrier: every page slot is final past this point

  std::vector<PageFailure> failed;
  std::vector<PageDiff> pages;
  for (std::size_t p = 0; p < total; ++p) {
    if (failures[p])
      failed.push_back(std::move(*failures[p]));
    else
      pages.push_back(std::move(*slots[p]));
  }
  if (!failed.empty()) {
    throw PartialResult(std::move(failed));
  }

  DiffResult result = assemble(std::move(pages));
  if (const auto problems = audit_coverage(a, b, result); !problems.empty()) {
    std::string msg = "coverage audit failed:";
    for (const auto &p : problems)
      msg += "\n  " + p;
    throw Error(Stage::Assemble, msg);
  }
  if (result.degraded_alignments > 0) {
    log::warn(std::to_string(result.degraded_alignments) + " alignment(s) degraded comparing '" +
              a.label + "' with '" + b.label + "'");
  }
  log::info("compared '" + a.label + "' with '" + b.label + "': " +
            std::to_string(result.records.size()) + " record(s)");
  return result;
}

} // namespace docdiff
