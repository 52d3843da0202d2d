#include "docdiff/hash.hpp"

#include <openssl/evp.h> // EVP_* digest API
#include <stdexcept>

namespace docdiff {

Sha1::Sha1() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_, EVP_sha1(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha1) failed");
  }
}

Sha1::~Sha1() { EVP_MD_CTX_free(ctx_); }

Sha1 &Sha1::update(std::string_view bytes) {
  if (finished_) {
    throw std::logic_error("Sha1::update after finish");
  }
  if (!bytes.empty() && EVP_DigestUpdate(ctx_, bytes.data(), bytes.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  return *this;
}

Digest Sha1::finish() {
  if (finished_) {
    throw std::logic_error("Sha1::finish called twice");
  }
  finished_ = true;
  Digest out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  if (len != out.size()) {
    throw std::runtime_error("SHA-1 produced unexpected length");
  }
  return out;
}

} // namespace docdiff
