#include "nopassplz/core/CredentialValidator.hpp"

#include "nopassplz/security/SecureEquals.hpp"

namespace nopassplz::core
{

std::optional<ValidationError> validateCredentials(const nopassplz::security::SecureString& username,
                                                   const nopassplz::security::SecureString& password,
                                                   const nopassplz::security::SecureString& confirmPassword) noexcept
{
    if (nopassplz::security::utf8CharLength(username) == 0U)
    {
        return ValidationError::EmptyUsername;
    }

    if (nopassplz::security::utf8CharLength(password) == 0U)
    {
        return ValidationError::EmptyPassword;
    }

    if (!nopassplz::security::secureEquals(password, confirmPassword))
    {
        return ValidationError::PasswordMismatch;
    }

    return std::nullopt;
}

} // namespace nopassplz::core
