#include "nopassplz/core/DeriverErrors.hpp"

namespace nopassplz::core
{

std::string_view toString(ValidationError error) noexcept
{
    switch (error)
    {
    case ValidationError::EmptyUsername:
        return "Username is empty";
    case ValidationError::EmptyPassword:
        return "Password is empty";
    case ValidationError::PasswordMismatch:
        return "Passwords do not match";
    }
    return "Unknown validation error";
}

std::string_view toString(DerivationError error) noexcept
{
    switch (error)
    {
    case DerivationError::KdfFailure:
        return "Key derivation failed";
    case DerivationError::SeedConversionFailure:
        return "Key derivation produced a seed of the wrong length";
    }
    return "Unknown derivation error";
}

} // namespace nopassplz::core
