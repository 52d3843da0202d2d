#pragma once

#include <array>
#include <cstdint>
#include <string_view>

struct evp_md_ctx_st; // EVP_MD_CTX

namespace docdiff {

// Raw 20-byte SHA-1 digest, used as a content signature for rows and blocks.
using Digest = std::array<std::uint8_t, 20>;

/**
 * Incremental SHA-1 (OpenSSL EVP). Feed tokens and separators with
 * update(), then call finish() once.
 * Throws std::runtime_error if any EVP call fails.
 */
class Sha1 {
public:
  Sha1();
  ~Sha1();
  Sha1(const Sha1 &) = delete;
  Sha1 &operator=(const Sha1 &) = delete;

  Sha1 &update(std::string_view bytes);
  Sha1 &update(char byte) { return update(std::string_view(&byte, 1)); }

  Digest finish();

private:
  evp_md_ctx_st *ctx_;
  bool finished_ = false;
};

} // namespace docdiff
