#ifndef INCLUDE_NOPASSPLZ_CORE_SEEDDERIVER_HPP
#define INCLUDE_NOPASSPLZ_CORE_SEEDDERIVER_HPP

#include "nopassplz/core/DeriverErrors.hpp"
#include "nopassplz/core/Seed.hpp"
#include "nopassplz/crypto/ICryptoProvider.hpp"
#include "nopassplz/crypto/KdfParameters.hpp"
#include "nopassplz/security/SecureString.hpp"
#include <variant>

namespace nopassplz::core
{

template <class T> using DerivationResult = std::variant<T, DerivationError>;

// Argon2id(password, salt = SHA3-512(username)). The salt is recomputed from the username every
// time, so nothing has to be stored; identical credentials always give the identical seed.
// Slow by design: with a preset this takes tens of seconds and gigabytes of memory.
[[nodiscard]] DerivationResult<Seed> deriveSeed(const nopassplz::crypto::ICryptoProvider& crypto,
                                                const nopassplz::security::SecureString& username,
                                                const nopassplz::security::SecureString& password,
                                                const nopassplz::crypto::KdfParameters& params);

} // namespace nopassplz::core

#endif // INCLUDE_NOPASSPLZ_CORE_SEEDDERIVER_HPP
