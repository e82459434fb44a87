#ifndef NOPASSPLZ_SRC_CORE_BIGENDIAN_HPP
#define NOPASSPLZ_SRC_CORE_BIGENDIAN_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace nopassplz::core::detail
{

constexpr std::size_t g_kU32Bytes{ sizeof(std::uint32_t) };

constexpr std::uint32_t g_kByteMaskU32{ 0xFFU };
constexpr std::uint32_t g_kBitsPerByte{ 8U };

[[nodiscard]] constexpr std::array<std::byte, g_kU32Bytes> encodeU32BE(std::uint32_t v) noexcept
{
    std::array<std::byte, g_kU32Bytes> out{};
    for (std::size_t i{}; i < out.size(); ++i)
    {
        const std::uint32_t shiftBits{ static_cast<std::uint32_t>(g_kU32Bytes - 1U - i) * g_kBitsPerByte };
        out[i] = static_cast<std::byte>((v >> shiftBits) & g_kByteMaskU32);
    }
    return out;
}

} // namespace nopassplz::core::detail

#endif // NOPASSPLZ_SRC_CORE_BIGENDIAN_HPP
