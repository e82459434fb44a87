#ifndef INCLUDE_NOPASSPLZ_SECURITY_SECUREARRAY_HPP
#define INCLUDE_NOPASSPLZ_SECURITY_SECUREARRAY_HPP

#include "nopassplz/security/MemoryWiper.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>

namespace nopassplz::security
{

// Fixed-size secret stored in place. The bytes are only reachable inside an unlock callback;
// the container cannot be copied, and erase() or destruction wipes the storage.
template <std::size_t N> class SecureArray final
{
public:
    static constexpr std::size_t g_kSize{ N };

    SecureArray() noexcept = default;

    SecureArray(const SecureArray&) = delete;
    SecureArray& operator=(const SecureArray&) = delete;

    SecureArray(SecureArray&& other) noexcept : m_erased{ other.m_erased }
    {
        m_bytes = other.m_bytes;
        other.erase();
    }

    SecureArray& operator=(SecureArray&& other) noexcept
    {
        if (this == &other)
        {
            return *this;
        }

        secureWipe(std::span<std::uint8_t>{ m_bytes });
        m_bytes = other.m_bytes;
        m_erased = other.m_erased;
        other.erase();
        return *this;
    }

    ~SecureArray() noexcept
    {
        secureWipe(std::span<std::uint8_t>{ m_bytes });
    }

    // Returns std::nullopt unless `bytes` is exactly N long.
    [[nodiscard]] static std::optional<SecureArray> fromBytes(std::span<const std::uint8_t> bytes) noexcept
    {
        if (bytes.size() != N)
        {
            return std::nullopt;
        }

        std::optional<SecureArray> out{ std::in_place };
        std::copy(bytes.begin(), bytes.end(), out->m_bytes.begin());
        return out;
    }

    template <class Fn> decltype(auto) unlock(Fn&& fn) const
    {
        requireLive();
        return std::forward<Fn>(fn)(std::span<const std::uint8_t, N>{ m_bytes });
    }

    template <class Fn> decltype(auto) unlockMut(Fn&& fn)
    {
        requireLive();
        return std::forward<Fn>(fn)(std::span<std::uint8_t, N>{ m_bytes });
    }

    // One-way: an erased array stays erased.
    void erase() noexcept
    {
        secureWipe(std::span<std::uint8_t>{ m_bytes });
        m_erased = true;
    }

    [[nodiscard]] bool isErased() const noexcept
    {
        return m_erased;
    }

    // Inspects the storage without unlocking it; valid after erase().
    [[nodiscard]] bool isZeroed() const noexcept
    {
        return isWiped(std::span<const std::uint8_t>{ m_bytes });
    }

    [[nodiscard]] static constexpr std::size_t size() noexcept
    {
        return N;
    }

private:
    void requireLive() const
    {
        if (m_erased)
        {
            throw std::logic_error("SecureArray: access after erase");
        }
    }

    std::array<std::uint8_t, N> m_bytes{};
    bool m_erased{ false };
};

} // namespace nopassplz::security

#endif // INCLUDE_NOPASSPLZ_SECURITY_SECUREARRAY_HPP
