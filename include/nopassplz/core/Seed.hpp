#ifndef INCLUDE_NOPASSPLZ_CORE_SEED_HPP
#define INCLUDE_NOPASSPLZ_CORE_SEED_HPP

#include "nopassplz/crypto/KdfParameters.hpp"
#include "nopassplz/security/SecureArray.hpp"

namespace nopassplz::core
{

// Root key of every derived password. Never persisted.
using Seed = nopassplz::security::SecureArray<nopassplz::crypto::g_kSeedBytes>;

} // namespace nopassplz::core

#endif // INCLUDE_NOPASSPLZ_CORE_SEED_HPP
