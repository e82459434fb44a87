#include "nopassplz/core/KdfPolicy.hpp"

namespace nopassplz::core
{
namespace
{

constexpr std::uint32_t g_kTwoGbKiB{ 2048000U };
constexpr std::uint32_t g_kFourGbKiB{ 4096000U };
constexpr std::uint32_t g_kEightGbKiB{ 8192000U };

constexpr std::uint32_t g_kDefaultIterations{ 8U };
constexpr std::uint32_t g_kVerySlowIterations{ 16U };
constexpr std::uint32_t g_kDefaultParallelism{ 1U };

[[nodiscard]] constexpr nopassplz::crypto::KdfParameters makeParams(std::uint32_t memoryKiB,
                                                                    std::uint32_t iterations) noexcept
{
    return nopassplz::crypto::KdfParameters{
        .memoryKiB = memoryKiB,
        .iterations = iterations,
        .parallelism = g_kDefaultParallelism,
        .outputBytes = static_cast<std::uint32_t>(nopassplz::crypto::g_kSeedBytes),
    };
}

} // namespace

nopassplz::crypto::KdfParameters kdfParametersFor(KdfPreset preset) noexcept
{
    switch (preset)
    {
    case KdfPreset::Fast:
        return makeParams(g_kTwoGbKiB, g_kDefaultIterations);
    case KdfPreset::Normal:
        return makeParams(g_kFourGbKiB, g_kDefaultIterations);
    case KdfPreset::Slow:
        return makeParams(g_kEightGbKiB, g_kDefaultIterations);
    case KdfPreset::VerySlow:
        return makeParams(g_kEightGbKiB, g_kVerySlowIterations);
    }
    return makeParams(g_kEightGbKiB, g_kDefaultIterations);
}

std::string_view kdfPresetName(KdfPreset preset) noexcept
{
    switch (preset)
    {
    case KdfPreset::Fast:
        return "fast";
    case KdfPreset::Normal:
        return "normal";
    case KdfPreset::Slow:
        return "slow";
    case KdfPreset::VerySlow:
        return "very_slow";
    }
    return "slow";
}

std::optional<KdfPreset> parseKdfPreset(std::string_view name) noexcept
{
    for (const KdfPreset preset : g_kAllKdfPresets)
    {
        if (kdfPresetName(preset) == name)
        {
            return preset;
        }
    }
    return std::nullopt;
}

std::chrono::seconds estimatedLatency(KdfPreset preset) noexcept
{
    switch (preset)
    {
    case KdfPreset::Fast:
        return std::chrono::seconds{ 17 };
    case KdfPreset::Normal:
        return std::chrono::seconds{ 35 };
    case KdfPreset::Slow:
        return std::chrono::seconds{ 71 };
    case KdfPreset::VerySlow:
        return std::chrono::seconds{ 137 };
    }
    return std::chrono::seconds{ 71 };
}

double memoryGigabytes(const nopassplz::crypto::KdfParameters& params) noexcept
{
    constexpr double kBytesPerKiB{ 1024.0 };
    constexpr double kBytesPerGb{ 1'000'000'000.0 };
    return static_cast<double>(params.memoryKiB) * kBytesPerKiB / kBytesPerGb;
}

} // namespace nopassplz::core
