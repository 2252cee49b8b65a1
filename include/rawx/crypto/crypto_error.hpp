#ifndef RAWX_CRYPTO_ERROR_HPP
#define RAWX_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace rawx::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message) 
        : CryptoError("Digest error: " + message) {}
};

} // namespace rawx::crypto

#endif // RAWX_CRYPTO_ERROR_HPP
