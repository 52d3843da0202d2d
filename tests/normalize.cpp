#include "docdiff/normalize.hpp"

#include <iostream>
#include <string>
#include <vector>

using docdiff::NormalizationPolicy;
using docdiff::Tokens;
using docdiff::tokenize;

static bool expect(const Tokens &got, const Tokens &want, const char *what) {
  if (got == want)
    return true;
  std::cerr << what << ": got [";
  for (const auto &t : got)
    std::cerr << '"' << t << "\" ";
  std::cerr << "]\n";
  return false;
}

int main() {
  const NormalizationPolicy defaults{};

  if (!tokenize("", defaults).empty()) { std::cerr << "empty input must give no tokens\n"; return 1; }
  if (!tokenize(" \t\n ", defaults).empty()) { std::cerr << "blank input must give no tokens\n"; return 1; }

  if (!expect(tokenize("  Width:   10mm\n", defaults), {"width:", "10mm"}, "default policy")) return 1;

  // case folding leaves UTF-8 bytes alone
  if (!expect(tokenize("ÄBC Déf", defaults), {"Äbc", "déf"}, "utf-8 passthrough")) return 1;

  {
    NormalizationPolicy keep_case{.case_fold = false};
    if (!expect(tokenize("Acme Pro", keep_case), {"Acme", "Pro"}, "no case fold")) return 1;
  }
  {
    NormalizationPolicy no_punct{.strip_punctuation = true};
    if (!expect(tokenize("Width: 10mm, (approx.) -- ok", no_punct), {"width", "10mm", "approx", "ok"},
                "strip punctuation"))
      return 1;
  }
  {
    NormalizationPolicy verbatim{.collapse_whitespace = false};
    if (!expect(tokenize(" a  b\tc ", verbatim), {"a", "  ", "b", "\t", "c"}, "verbatim whitespace"))
      return 1;
  }

  // pure: same input, same output
  const std::string text = "Brand: Acme   Pro\nCode 42";
  if (tokenize(text, defaults) != tokenize(text, defaults)) { std::cerr << "tokenize not deterministic\n"; return 1; }

  docdiff::TextBlock blk{.text = "Hello World"};
  if (!expect(tokenize(blk, defaults), {"hello", "world"}, "text block overload")) return 1;
  docdiff::Cell cell{.text = "Acme"};
  if (!expect(tokenize(cell, defaults), {"acme"}, "cell overload")) return 1;

  std::cout << "OK\n";
  return 0;
}
