#include <gtest/gtest.h>

#include "nopassplz/core/KdfPolicy.hpp"

using nopassplz::core::KdfPreset;

TEST(KdfPolicy, PresetsMatchPublishedCosts)
{
    const auto fast = nopassplz::core::kdfParametersFor(KdfPreset::Fast);
    const auto normal = nopassplz::core::kdfParametersFor(KdfPreset::Normal);
    const auto slow = nopassplz::core::kdfParametersFor(KdfPreset::Slow);
    const auto verySlow = nopassplz::core::kdfParametersFor(KdfPreset::VerySlow);

    EXPECT_EQ(fast, (nopassplz::crypto::KdfParameters{ 2048000U, 8U, 1U, 64U }));
    EXPECT_EQ(normal, (nopassplz::crypto::KdfParameters{ 4096000U, 8U, 1U, 64U }));
    EXPECT_EQ(slow, (nopassplz::crypto::KdfParameters{ 8192000U, 8U, 1U, 64U }));
    EXPECT_EQ(verySlow, (nopassplz::crypto::KdfParameters{ 8192000U, 16U, 1U, 64U }));
}

TEST(KdfPolicy, EveryPresetProducesASeedSizedOutput)
{
    for (const auto preset : nopassplz::core::g_kAllKdfPresets)
    {
        EXPECT_EQ(nopassplz::core::kdfParametersFor(preset).outputBytes, nopassplz::crypto::g_kSeedBytes);
    }
}

TEST(KdfPolicy, DefaultPresetIsSlow)
{
    EXPECT_EQ(nopassplz::core::g_kDefaultKdfPreset, KdfPreset::Slow);
}

TEST(KdfPolicy, NamesRoundTripThroughParser)
{
    for (const auto preset : nopassplz::core::g_kAllKdfPresets)
    {
        EXPECT_EQ(nopassplz::core::parseKdfPreset(nopassplz::core::kdfPresetName(preset)), preset);
    }
    EXPECT_EQ(nopassplz::core::kdfPresetName(KdfPreset::VerySlow), "very_slow");
    EXPECT_FALSE(nopassplz::core::parseKdfPreset("turbo").has_value());
    EXPECT_FALSE(nopassplz::core::parseKdfPreset("").has_value());
}

TEST(KdfPolicy, LatencyGrowsWithCost)
{
    EXPECT_EQ(nopassplz::core::estimatedLatency(KdfPreset::Fast).count(), 17);
    EXPECT_LT(nopassplz::core::estimatedLatency(KdfPreset::Fast), nopassplz::core::estimatedLatency(KdfPreset::Normal));
    EXPECT_LT(nopassplz::core::estimatedLatency(KdfPreset::Normal), nopassplz::core::estimatedLatency(KdfPreset::Slow));
    EXPECT_LT(nopassplz::core::estimatedLatency(KdfPreset::Slow),
              nopassplz::core::estimatedLatency(KdfPreset::VerySlow));
}

TEST(KdfPolicy, MemoryIsReportedInDecimalGigabytes)
{
    EXPECT_NEAR(nopassplz::core::memoryGigabytes(nopassplz::core::kdfParametersFor(KdfPreset::Fast)), 2.097152, 1e-9);
    EXPECT_NEAR(nopassplz::core::memoryGigabytes(nopassplz::core::kdfParametersFor(KdfPreset::Slow)), 8.388608, 1e-9);
}
