#include "docdiff/config.hpp"

#include "docdiff/errors.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

bool parse_bool(const std::string &key, const std::string &v) {
  if (v == "true" || v == "yes" || v == "1")
    return true;
  if (v == "false" || v == "no" || v == "0")
    return false;
  throw docdiff::ConfigError("config: " + key + ": expected true/false, got '" + v + "'");
}

std::size_t parse_size(const std::string &key, const std::string &v) {
  std::size_t out = 0;
  const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
  if (ec != std::errc{} || ptr != v.data() + v.size() || v.empty())
    throw docdiff::ConfigError("config: " + key + ": expected a non-negative integer, got '" + v +
                               "'");
  return out;
}

double parse_fraction(const std::string &key, const std::string &v) {
  std::istringstream is(v);
  double out = 0;
  is >> out;
  if (!is || !is.eof())
    throw docdiff::ConfigError("config: " + key + ": expected a number, got '" + v + "'");
  return out;
}

} // namespace

namespace docdiff {

std::size_t default_parallelism() {
  const unsigned n = std::thread::hardware_concurrency();
  return n == 0 ? 1 : n;
}

void Options::validate() const {
  auto unit = [](const char *name, double v) {
    if (!(v >= 0.0 && v <= 1.0))
      throw ConfigError(std::string("config: ") + name + " must be within [0, 1]");
  };
  unit("row_similarity_threshold", row_similarity_threshold);
  unit("block_similarity_threshold", block_similarity_threshold);
  unit("image_similarity_threshold", image_similarity_threshold);
  if (parallelism == 0)
    throw ConfigError("config: parallelism must be at least 1");
  if (max_alignment_cost == 0)
    throw ConfigError("config: max_alignment_cost must be at least 1");
}

Options parse_options(std::string_view text) {
  Options out{};
  std::istringstream iss{std::string(text)};
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(iss, line)) {
    ++lineno;
    const std::string t = trim(line);
    if (t.empty() || t[0] == '#')
      continue; // allow comments
    const auto colon = t.find(':');
    if (colon == std::string::npos)
      throw ConfigError("config: line " + std::to_string(lineno) + ": expected 'key: value'");
    const std::string key = trim(std::string_view(t).substr(0, colon));
    const std::string val = trim(std::string_view(t).substr(colon + 1));

    if (key == "case_fold")
      out.normalization.case_fold = parse_bool(key, val);
    else if (key == "collapse_whitespace")
      out.normalization.collapse_whitespace = parse_bool(key, val);
    else if (key == "strip_punctuation")
      out.normalization.strip_punctuation = parse_bool(key, val);
    else if (key == "highlight")
      out.highlight = parse_bool(key, val);
    else if (key == "context_size")
      out.context_size = parse_size(key, val);
    else if (key == "parallelism")
      out.parallelism = parse_size(key, val);
    else if (key == "max_alignment_cost")
      out.max_alignment_cost = parse_size(key, val);
    else if (key == "max_pages")
      out.max_pages = parse_size(key, val);
    else if (key == "row_similarity_threshold")
      out.row_similarity_threshold = parse_fraction(key, val);
    else if (key == "block_similarity_threshold")
      out.block_similarity_threshold = parse_fraction(key, val);
    else if (key == "image_similarity_threshold")
      out.image_similarity_threshold = parse_fraction(key, val);
    else if (key == "log_level") {
      if (!log::parse_level(val, out.log_level))
        throw ConfigError("config: log_level: unknown level '" + val + "'");
    } else
      throw ConfigError("config: line " + std::to_string(lineno) + ": unknown key '" + key + "'");
  }
  out.validate();
  return out;
}

Options load_options(const std::filesystem::path &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    throw ConfigError("config: open for read failed: " + path.string());
  }
  std::ostringstream buf;
  buf << ifs.rdbuf();
  return parse_options(buf.str());
}

void configure_logging(const Options &options) { log::set_level(options.log_level); }

} // namespace docdiff
