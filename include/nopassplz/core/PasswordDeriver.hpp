#ifndef INCLUDE_NOPASSPLZ_CORE_PASSWORDDERIVER_HPP
#define INCLUDE_NOPASSPLZ_CORE_PASSWORDDERIVER_HPP

#include "nopassplz/core/DeriverErrors.hpp"
#include "nopassplz/core/Seed.hpp"
#include "nopassplz/crypto/ICryptoProvider.hpp"
#include "nopassplz/crypto/KdfParameters.hpp"
#include "nopassplz/security/SecureString.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <variant>

namespace nopassplz::core
{

enum class DeriverState : std::uint8_t
{
    Uninitialized,
    Validating,
    Deriving,
    Ready,
    Erased,
};

class PasswordDeriver;

using DeriverHandle = std::unique_ptr<PasswordDeriver>;
using CreateResult = std::variant<DeriverHandle, ValidationError, DerivationError>;

// Called on the constructing thread as construction moves through Validating and Deriving.
using StateObserver = std::function<void(DeriverState)>;

// Owns exactly one seed. deriveAt() may run concurrently from many threads; erase() waits for
// them and is one-way. The crypto provider must outlive the deriver.
class PasswordDeriver final
{
    // Restricts construction to create() while still allowing std::make_unique.
    struct ConstructionKey
    {
        explicit ConstructionKey() = default;
    };

public:
    // Validates first and only then runs the KDF, so bad input never pays for it.
    // The credentials are left untouched; the caller wipes them.
    [[nodiscard]] static CreateResult create(const nopassplz::crypto::ICryptoProvider& crypto,
                                             const nopassplz::security::SecureString& username,
                                             const nopassplz::security::SecureString& password,
                                             const nopassplz::security::SecureString& confirmPassword,
                                             const nopassplz::crypto::KdfParameters& params,
                                             const StateObserver& observer = {});

    PasswordDeriver(ConstructionKey key, const nopassplz::crypto::ICryptoProvider& crypto, Seed&& seed,
                    const nopassplz::crypto::KdfParameters& params) noexcept;

    PasswordDeriver(const PasswordDeriver&) = delete;
    PasswordDeriver& operator=(const PasswordDeriver&) = delete;
    PasswordDeriver(PasswordDeriver&&) = delete;
    PasswordDeriver& operator=(PasswordDeriver&&) = delete;
    ~PasswordDeriver() noexcept;

    // Returns std::nullopt once erased.
    [[nodiscard]] std::optional<nopassplz::security::SecureString> deriveAt(std::uint32_t index) const;

    // Waits for running deriveAt() calls. Throws std::system_error if the lock cannot be taken.
    void erase();

    [[nodiscard]] DeriverState state() const noexcept;
    [[nodiscard]] const nopassplz::crypto::KdfParameters& kdfParameters() const noexcept;

private:
    const nopassplz::crypto::ICryptoProvider& m_crypto;
    nopassplz::crypto::KdfParameters m_params;
    mutable std::shared_mutex m_mutex;
    Seed m_seed;
};

} // namespace nopassplz::core

#endif // INCLUDE_NOPASSPLZ_CORE_PASSWORDDERIVER_HPP
