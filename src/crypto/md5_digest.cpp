#include "rawx/crypto/md5_digest.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace rawx::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create digest context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Md5Digest::Md5Digest() : context_(std::make_unique<DigestContext>()) {
  if (!EVP_DigestInit_ex(context_->get(), EVP_md5(), nullptr)) {
    throw DigestError("Failed to initialize MD5 context");
  }
}

Md5Digest::~Md5Digest() = default;

//==============================================
// DIGEST OPERATIONS
//==============================================

void Md5Digest::update(const char* data, std::size_t size) {
  if (finalized_) {
    throw DigestError("Digest already finalized");
  }
  if (size == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    throw DigestError("Failed to update MD5 digest");
  }
}

std::string Md5Digest::hex_digest() {
  if (finalized_) {
    return result_;
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;

  if (!EVP_DigestFinal_ex(context_->get(), hash, &hash_len)) {
    throw DigestError("Failed to finalize MD5 digest");
  }
  finalized_ = true;

  // Convert the raw hash bytes to an uppercase hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }

  result_ = ss.str();
  BOOST_LOG_TRIVIAL(trace) << "Md5Digest: Finalized digest " << result_;
  return result_;
}

std::string Md5Digest::of(const std::string& data) {
  Md5Digest digest;
  digest.update(data.data(), data.size());
  return digest.hex_digest();
}

} // namespace rawx::crypto
