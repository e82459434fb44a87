#ifndef INCLUDE_NOPASSPLZ_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_NOPASSPLZ_SECURITY_SCOPEWIPE_HPP

#include "nopassplz/security/MemoryWiper.hpp"
#include "nopassplz/security/SecureBuffer.hpp"
#include "nopassplz/security/SecureString.hpp"
#include <cstddef>
#include <span>
#include <string>
#include <type_traits>
#include <utility>

namespace nopassplz::security
{
// Wipes an intermediate secret (salt, raw KDF output, MAC, hex text) when the scope is left,
// on both the normal and the exceptional path.
// The guarded storage must outlive the guard and must not reallocate while guarded.
class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> bytes) noexcept : m_bytes{ bytes }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;

    ScopeWipe(ScopeWipe&& other) noexcept : m_bytes{ std::exchange(other.m_bytes, {}) }
    {
    }

    ScopeWipe& operator=(ScopeWipe&& other) noexcept
    {
        if (this != &other)
        {
            secureWipe(m_bytes);
            m_bytes = std::exchange(other.m_bytes, {});
        }
        return *this;
    }

    ~ScopeWipe() noexcept
    {
        secureWipe(m_bytes);
    }

    // Stops guarding; the bytes are left as they are.
    void release() noexcept
    {
        m_bytes = {};
    }

    [[nodiscard]] std::size_t guardedSize() const noexcept
    {
        return m_bytes.size();
    }

private:
    std::span<std::byte> m_bytes;
};

template <typename T, std::size_t Extent>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
[[nodiscard]] ScopeWipe scopeWipe(std::span<T, Extent> bytes) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span<T>{ bytes }) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureBuffer& buffer) noexcept
{
    return ScopeWipe{ asWritableBytes(buffer) };
}

[[nodiscard]] inline ScopeWipe scopeWipe(SecureString& text) noexcept
{
    return ScopeWipe{ asWritableBytes(text) };
}

// A plain std::string that briefly held secret text, e.g. a terminal line.
[[nodiscard]] inline ScopeWipe scopeWipe(std::string& text) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span<char>{ text.data(), text.size() }) };
}

} // namespace nopassplz::security

#endif // INCLUDE_NOPASSPLZ_SECURITY_SCOPEWIPE_HPP
