/*
 * (c) 2024 Safie Inc.
 *
 * NOTICE: No part of this file may be reproduced, stored
 * in a retrieval system, or transmitted, in any form, or by any means,
 * electronic, mechanical, photocopying, recording, or otherwise,
 * without the prior consent of Safie Inc.
 */

#include <gtest/gtest.h>

#include "clinical/NormativeData.hpp"

TEST(NormativeDataTest, BandContainingTheAge)
{
    const std::optional<NormalRange> range =
        NormativeData::Lookup(NormativeMetric::Cadence, 45, BiologicalSex::Female);
    ASSERT_TRUE(range.has_value());
    EXPECT_DOUBLE_EQ(range->low, 110.0);
    EXPECT_DOUBLE_EQ(range->high, 120.0);
}

TEST(NormativeDataTest, FirstBandWithoutAge)
{
    const std::optional<NormalRange> range = NormativeData::Lookup(NormativeMetric::GaitSpeed, std::nullopt);
    ASSERT_TRUE(range.has_value());
    EXPECT_DOUBLE_EQ(range->low, 1.10);
    EXPECT_DOUBLE_EQ(range->high, 1.36);
}

TEST(NormativeDataTest, NearestBandOutsideTheTable)
{
    // cadence bands stop at 79, the 60-79 band is nearest
    const std::optional<NormalRange> old = NormativeData::Lookup(NormativeMetric::Cadence, 90, BiologicalSex::Male);
    ASSERT_TRUE(old.has_value());
    EXPECT_DOUBLE_EQ(old->low, 98.0);

    const std::optional<NormalRange> young = NormativeData::Lookup(NormativeMetric::Cadence, 12, BiologicalSex::Male);
    ASSERT_TRUE(young.has_value());
    EXPECT_DOUBLE_EQ(young->low, 112.0);
}

TEST(NormativeDataTest, SexNeutralBandsMatchEveryone)
{
    const std::optional<NormalRange> range =
        NormativeData::Lookup(NormativeMetric::CraniovertebralAngle, 65, BiologicalSex::Male);
    ASSERT_TRUE(range.has_value());
    EXPECT_DOUBLE_EQ(range->low, 40.0);
    EXPECT_DOUBLE_EQ(range->high, 50.0);
}

TEST(NormativeDataTest, UnsetSexFallsBackToTheWholeTable)
{
    // no cadence band is sex neutral, the first containing band is the male one
    const std::optional<NormalRange> range = NormativeData::Lookup(NormativeMetric::Cadence, 30);
    ASSERT_TRUE(range.has_value());
    EXPECT_DOUBLE_EQ(range->low, 112.0);
}

TEST(NormativeDataTest, ClassifyByRelativeDeviation)
{
    // 20-29 kyphosis band is 20-30, span 10
    EXPECT_EQ(NormativeData::Classify(25.0, NormativeMetric::ThoracicKyphosis, 25), Severity::Normal);
    EXPECT_EQ(NormativeData::Classify(32.0, NormativeMetric::ThoracicKyphosis, 25), Severity::Mild);
    EXPECT_EQ(NormativeData::Classify(15.0, NormativeMetric::ThoracicKyphosis, 25), Severity::Moderate);
    EXPECT_EQ(NormativeData::Classify(40.0, NormativeMetric::ThoracicKyphosis, 25), Severity::Severe);
}
