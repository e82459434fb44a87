#ifndef INCLUDE_NOPASSPLZ_CORE_DERIVERERRORS_HPP
#define INCLUDE_NOPASSPLZ_CORE_DERIVERERRORS_HPP

#include <cstdint>
#include <string_view>

namespace nopassplz::core
{

// Cheap, deterministic input errors. Always reported before any hashing starts.
enum class ValidationError : std::uint8_t
{
    EmptyUsername,
    EmptyPassword,
    PasswordMismatch,
};

// Fatal for one construction attempt. Nothing is retried automatically.
enum class DerivationError : std::uint8_t
{
    KdfFailure,
    SeedConversionFailure,
};

[[nodiscard]] std::string_view toString(ValidationError error) noexcept;
[[nodiscard]] std::string_view toString(DerivationError error) noexcept;

} // namespace nopassplz::core

#endif // INCLUDE_NOPASSPLZ_CORE_DERIVERERRORS_HPP
