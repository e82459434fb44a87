#ifndef INTERNAL_NOPASSPLZ_CRYPTO_OPENSSLDIGEST_HPP
#define INTERNAL_NOPASSPLZ_CRYPTO_OPENSSLDIGEST_HPP

#include "nopassplz/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace nopassplz::crypto::openssl
{

// SHA3-512 and HMAC-SHA3-512 through OpenSSL 3 EVP. Both throw std::runtime_error on backend failure.
[[nodiscard]] nopassplz::security::SecureBuffer sha3_512(std::span<const std::byte> data);

[[nodiscard]] nopassplz::security::SecureBuffer hmacSha3_512(std::span<const std::uint8_t> key,
                                                             std::span<const std::byte> message);

} // namespace nopassplz::crypto::openssl

#endif // INTERNAL_NOPASSPLZ_CRYPTO_OPENSSLDIGEST_HPP
