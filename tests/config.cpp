#include "docdiff/config.hpp"
#include "docdiff/engine.hpp"
#include "docdiff/errors.hpp"
#include "docdiff/log.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static bool rejects(std::string_view text) {
  try {
    (void)docdiff::parse_options(text);
  } catch (const docdiff::ConfigError &e) {
    return e.stage() == docdiff::Stage::Config;
  }
  return false;
}

int main() {
  // Defaults
  {
    const auto o = docdiff::parse_options("");
    if (o.context_size != 3 || o.row_similarity_threshold != 0.6 || o.image_similarity_threshold != 0.10 ||
        !o.normalization.case_fold || o.normalization.strip_punctuation || !o.highlight || o.max_pages ||
        o.log_level != docdiff::log::Level::Warn || o.parallelism == 0) {
      std::cerr << "unexpected defaults\n"; return 1;
    }
  }

  // Every key
  {
    const auto o = docdiff::parse_options("# comparison settings\n"
                                          "case_fold: false\n"
                                          "collapse_whitespace: no\n"
                                          "strip_punctuation: true\n"
                                          "highlight: 0\n"
                                          "\n"
                                          "  context_size:  5  \r\n"
                                          "parallelism: 2\n"
                                          "max_alignment_cost: 100\n"
                                          "max_pages: 10\n"
                                          "row_similarity_threshold: 0.75\n"
                                          "block_similarity_threshold: 0.5\n"
                                          "image_similarity_threshold: 0.2\n"
                                          "log_level: debug\n");
    if (o.normalization.case_fold || o.normalization.collapse_whitespace ||
        !o.normalization.strip_punctuation || o.highlight) {
      std::cerr << "boolean keys\n"; return 1;
    }
    if (o.context_size != 5 || o.parallelism != 2 || o.max_alignment_cost != 100 || o.max_pages != 10u) {
      std::cerr << "integer keys\n"; return 1;
    }
    if (o.row_similarity_threshold != 0.75 || o.block_similarity_threshold != 0.5 ||
        o.image_similarity_threshold != 0.2) {
      std::cerr << "threshold keys\n"; return 1;
    }
    if (o.log_level != docdiff::log::Level::Debug) { std::cerr << "log level\n"; return 1; }
    const auto ao = o.align_options();
    if (ao.context != 5 || ao.max_cost != 100) { std::cerr << "align options\n"; return 1; }
  }

  // Bad input
  if (!rejects("colour: blue\n")) { std::cerr << "unknown key accepted\n"; return 1; }
  if (!rejects("context_size\n")) { std::cerr << "missing colon accepted\n"; return 1; }
  if (!rejects("context_size: -1\n")) { std::cerr << "negative size accepted\n"; return 1; }
  if (!rejects("parallelism: 0\n")) { std::cerr << "zero workers accepted\n"; return 1; }
  if (!rejects("highlight: maybe\n")) { std::cerr << "bad boolean accepted\n"; return 1; }
  if (!rejects("row_similarity_threshold: 1.5\n")) { std::cerr << "threshold above 1 accepted\n"; return 1; }
  if (!rejects("image_similarity_threshold: 0.1x\n")) { std::cerr << "trailing junk accepted\n"; return 1; }
  if (!rejects("log_level: loud\n")) { std::cerr << "bad log level accepted\n"; return 1; }

  // Config file on disk
  const fs::path root =
      fs::temp_directory_path() / ("docdiff_config_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);
  try {
    std::ofstream(root / "docdiff.conf", std::ios::binary) << "context_size: 1\nlog_level: info\n";
    const auto o = docdiff::load_options(root / "docdiff.conf");
    if (o.context_size != 1 || o.log_level != docdiff::log::Level::Info) {
      std::cerr << "config file not applied\n";
      fs::remove_all(root);
      return 1;
    }
    bool threw = false;
    try {
      (void)docdiff::load_options(root / "missing.conf");
    } catch (const docdiff::ConfigError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "missing config file must throw\n";
      fs::remove_all(root);
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "Exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);

  // Logging follows the options and reaches the installed sink
  {
    std::vector<std::string> lines;
    docdiff::log::set_sink([&](docdiff::log::Level l, std::string_view m) {
      lines.push_back(std::string(docdiff::log::level_name(l)) + ": " + std::string(m));
    });

    docdiff::Options o;
    o.log_level = docdiff::log::Level::Info;
    o.parallelism = 1;
    docdiff::configure_logging(o);
    docdiff::log::debug("hidden");
    docdiff::Page page;
    page.size = {612, 792};
    page.blocks.push_back({.text = "hello", .box = {}});
    const docdiff::Document doc{.label = "x.pdf", .pages = {page}};
    (void)docdiff::compare(doc, doc, o);

    o.log_level = docdiff::log::Level::Off;
    docdiff::configure_logging(o);
    docdiff::log::error("also hidden");
    docdiff::log::set_sink({});
    docdiff::log::set_level(docdiff::log::Level::Warn);

    if (lines.size() != 1 || lines[0].rfind("info: compared 'x.pdf'", 0) != 0) {
      std::cerr << "expected one info line, got " << lines.size() << "\n";
      for (const auto &l : lines)
        std::cerr << "  " << l << "\n";
      return 1;
    }

    // a sink may replace itself while handling a message
    int calls = 0;
    docdiff::log::set_sink([&](docdiff::log::Level, std::string_view) {
      ++calls;
      docdiff::log::set_sink({});
    });
    docdiff::log::warn("handled by the callback");
    docdiff::log::warn("handled by the default sink");
    if (calls != 1) { std::cerr << "sink replacing itself ran " << calls << " times\n"; return 1; }

    docdiff::log::Level l{};
    if (!docdiff::log::parse_level("error", l) || l != docdiff::log::Level::Error ||
        docdiff::log::parse_level("ERROR", l)) {
      std::cerr << "parse_level\n"; return 1;
    }
  }

  std::cout << "OK\n";
  return 0;
}
