#include "nopassplz/core/PasswordDeriver.hpp"

#include "nopassplz/core/CredentialValidator.hpp"
#include "nopassplz/core/IndexDeriver.hpp"
#include "nopassplz/core/SeedDeriver.hpp"
#include <memory>
#include <mutex>
#include <utility>

namespace nopassplz::core
{
namespace
{

void notify(const StateObserver& observer, DeriverState state)
{
    if (observer)
    {
        observer(state);
    }
}

} // namespace

CreateResult PasswordDeriver::create(const nopassplz::crypto::ICryptoProvider& crypto,
                                     const nopassplz::security::SecureString& username,
                                     const nopassplz::security::SecureString& password,
                                     const nopassplz::security::SecureString& confirmPassword,
                                     const nopassplz::crypto::KdfParameters& params, const StateObserver& observer)
{
    notify(observer, DeriverState::Validating);
    if (const auto invalid{ validateCredentials(username, password, confirmPassword) }; invalid.has_value())
    {
        return *invalid;
    }

    notify(observer, DeriverState::Deriving);
    auto seedRes{ deriveSeed(crypto, username, password, params) };
    if (const auto* err{ std::get_if<DerivationError>(&seedRes) }; err != nullptr)
    {
        return *err;
    }

    auto deriver{ std::make_unique<PasswordDeriver>(ConstructionKey{}, crypto, std::move(std::get<Seed>(seedRes)),
                                                    params) };
    notify(observer, DeriverState::Ready);
    return CreateResult{ std::move(deriver) };
}

PasswordDeriver::PasswordDeriver(ConstructionKey /*key*/, const nopassplz::crypto::ICryptoProvider& crypto,
                                 Seed&& seed, const nopassplz::crypto::KdfParameters& params) noexcept
    : m_crypto(crypto), m_params(params), m_seed(std::move(seed))
{
}

// No reader can still hold a reference here, so the seed is wiped without taking the lock.
PasswordDeriver::~PasswordDeriver() noexcept
{
    m_seed.erase();
}

std::optional<nopassplz::security::SecureString> PasswordDeriver::deriveAt(std::uint32_t index) const
{
    std::shared_lock lock{ m_mutex };
    if (m_seed.isErased())
    {
        return std::nullopt;
    }
    return nopassplz::core::deriveAt(m_crypto, m_seed, index);
}

void PasswordDeriver::erase()
{
    std::unique_lock lock{ m_mutex };
    m_seed.erase();
}

DeriverState PasswordDeriver::state() const noexcept
{
    std::shared_lock lock{ m_mutex };
    return m_seed.isErased() ? DeriverState::Erased : DeriverState::Ready;
}

const nopassplz::crypto::KdfParameters& PasswordDeriver::kdfParameters() const noexcept
{
    return m_params;
}

} // namespace nopassplz::core
