#ifndef RAWX_CRYPTO_MD5_DIGEST_HPP
#define RAWX_CRYPTO_MD5_DIGEST_HPP

#include <cstddef>
#include <memory>
#include <string>
#include "rawx/crypto/crypto_error.hpp"

namespace rawx::crypto {

// Forward declaration for OpenSSL digest context
struct DigestContext;

// Running MD5 over a byte stream, rendered as uppercase hexadecimal
class Md5Digest {
public:

  static constexpr std::size_t DIGEST_SIZE = 16;   // 128 bits

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Md5Digest();
  ~Md5Digest();

  Md5Digest(const Md5Digest&) = delete;
  Md5Digest& operator=(const Md5Digest&) = delete;

  
  // ---- DIGEST OPERATIONS ----
  // Feeds a block of bytes into the digest
  void update(const char* data, std::size_t size);
  // Finalizes the digest; further updates are rejected
  std::string hex_digest();

  
  // ---- CONVENIENCE ----
  // One-shot digest of a whole string
  static std::string of(const std::string& data);

private:
  // ---- PARAMETERS ----
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
  std::string result_;
};

} // namespace rawx::crypto

#endif // RAWX_CRYPTO_MD5_DIGEST_HPP
