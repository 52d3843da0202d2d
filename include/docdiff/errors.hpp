#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace docdiff {

// Pipeline stage an error is attributed to.
// Schedule covers page tasks that were cancelled or failed outside a stage.
enum class Stage : std::uint8_t {
  Validate,
  Schedule,
  Text,
  Table,
  Image,
  Assemble,
  Merge,
  Config,
};

std::string_view stage_name(Stage stage);

class Error : public std::runtime_error {
public:
  Error(Stage stage, const std::string &what) : std::runtime_error(what), stage_(stage) {}
  [[nodiscard]] Stage stage() const { return stage_; }

private:
  Stage stage_;
};

// Nothing meaningful to diff (e.g. a document with zero pages).
class StructuralMismatch : public Error {
public:
  explicit StructuralMismatch(const std::string &what) : Error(Stage::Validate, what) {}
};

class ConfigError : public Error {
public:
  explicit ConfigError(const std::string &what) : Error(Stage::Config, what) {}
};

struct PageFailure {
  std::size_t page;
  Stage stage;
  std::string message;
};

// Per-page processing was cancelled or failed; no DiffResult is produced.
class PartialResult : public Error {
public:
  explicit PartialResult(std::vector<PageFailure> failures);

  [[nodiscard]] const std::vector<PageFailure> &failures() const { return failures_; }
  [[nodiscard]] std::vector<std::size_t> pages() const;

private:
  std::vector<PageFailure> failures_;
};

} // namespace docdiff
