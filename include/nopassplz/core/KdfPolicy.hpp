#ifndef INCLUDE_NOPASSPLZ_CORE_KDFPOLICY_HPP
#define INCLUDE_NOPASSPLZ_CORE_KDFPOLICY_HPP

#include "nopassplz/crypto/KdfParameters.hpp"
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace nopassplz::core
{

// Named cost/latency trade-offs. These are the only configurations offered to end users.
enum class KdfPreset : std::uint8_t
{
    Fast,
    Normal,
    Slow,
    VerySlow,
};

constexpr std::array<KdfPreset, 4> g_kAllKdfPresets{ KdfPreset::Fast, KdfPreset::Normal, KdfPreset::Slow,
                                                     KdfPreset::VerySlow };

constexpr KdfPreset g_kDefaultKdfPreset{ KdfPreset::Slow };

[[nodiscard]] nopassplz::crypto::KdfParameters kdfParametersFor(KdfPreset preset) noexcept;

[[nodiscard]] std::string_view kdfPresetName(KdfPreset preset) noexcept;

// Accepts the names returned by kdfPresetName ("fast", "normal", "slow", "very_slow").
[[nodiscard]] std::optional<KdfPreset> parseKdfPreset(std::string_view name) noexcept;

// Measured on 2025 consumer hardware; for display only.
[[nodiscard]] std::chrono::seconds estimatedLatency(KdfPreset preset) noexcept;

// Decimal gigabytes, the unit shown to users next to each preset.
[[nodiscard]] double memoryGigabytes(const nopassplz::crypto::KdfParameters& params) noexcept;

} // namespace nopassplz::core

#endif // INCLUDE_NOPASSPLZ_CORE_KDFPOLICY_HPP
