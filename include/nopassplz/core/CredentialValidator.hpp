#ifndef INCLUDE_NOPASSPLZ_CORE_CREDENTIALVALIDATOR_HPP
#define INCLUDE_NOPASSPLZ_CORE_CREDENTIALVALIDATOR_HPP

#include "nopassplz/core/DeriverErrors.hpp"
#include "nopassplz/security/SecureString.hpp"
#include <optional>

namespace nopassplz::core
{

// Checks in order: username non-empty, password non-empty, password == confirmPassword.
// Lengths are counted in UTF-8 code points. Returns std::nullopt when the credentials are usable.
[[nodiscard]] std::optional<ValidationError>
validateCredentials(const nopassplz::security::SecureString& username, const nopassplz::security::SecureString& password,
                    const nopassplz::security::SecureString& confirmPassword) noexcept;

} // namespace nopassplz::core

#endif // INCLUDE_NOPASSPLZ_CORE_CREDENTIALVALIDATOR_HPP
