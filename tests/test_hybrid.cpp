#include <gtest/gtest.h>
#include "hybrid_quantizer.h"
#include "color_math.h"
#include "test_helpers.h"

namespace {

    HybridQuantizer MakeQuantizer(uint32_t seed, BudgetPolicy policy = BudgetPolicy::Normalized) {
        HybridOptions options;
        options.policy = policy;
        options.kmeans.seed = seed;
        return HybridQuantizer(options);
    }

    ExtractedColor Entry(uint8_t r, uint8_t g, uint8_t b, float frequency) {
        return ExtractedColor(RGBColor(r, g, b), frequency);
    }

}

TEST(HybridQuantizerTest, SplitBudgetPolicies) {
    HybridBudgets b = HybridQuantizer::SplitBudget(10, BudgetPolicy::Floored);
    EXPECT_EQ(b.octree, 4);
    EXPECT_EQ(b.medianCut, 3);
    EXPECT_EQ(b.kmeans, 3);

    // Flooring each share independently loses a color here.
    b = HybridQuantizer::SplitBudget(5, BudgetPolicy::Floored);
    EXPECT_EQ(b.octree + b.medianCut + b.kmeans, 4);

    b = HybridQuantizer::SplitBudget(5, BudgetPolicy::Normalized);
    EXPECT_EQ(b.octree, 2);
    EXPECT_EQ(b.medianCut, 1);
    EXPECT_EQ(b.kmeans, 2);

    b = HybridQuantizer::SplitBudget(1, BudgetPolicy::Normalized);
    EXPECT_EQ(b.octree, 0);
    EXPECT_EQ(b.medianCut, 0);
    EXPECT_EQ(b.kmeans, 1);
}

TEST(HybridQuantizerTest, FusionWeightsByFrequency) {
    const auto fused = HybridQuantizer::FuseSimilarColors(
        { Entry(0, 0, 0, 0.5f), Entry(10, 0, 0, 0.5f), Entry(200, 200, 200, 0.2f) }, 20.0f);
    ASSERT_EQ(fused.size(), 2u);
    EXPECT_EQ(fused[0].color, RGBColor(5, 0, 0));
    EXPECT_FLOAT_EQ(fused[0].frequency, 1.0f);
    EXPECT_EQ(fused[1].color, RGBColor(200, 200, 200));
}

TEST(HybridQuantizerTest, FusionKeepsMaxMetrics) {
    ExtractedColor a = Entry(50, 50, 50, 0.3f);
    a.importance = 0.2f;
    a.representativeness = 0.9f;
    ExtractedColor b = Entry(52, 50, 50, 0.1f);
    b.importance = 0.7f;
    b.representativeness = 0.1f;

    const auto fused = HybridQuantizer::FuseSimilarColors({ a, b }, 5.0f);
    ASSERT_EQ(fused.size(), 1u);
    EXPECT_FLOAT_EQ(fused[0].importance, 0.7f);
    EXPECT_FLOAT_EQ(fused[0].representativeness, 0.9f);
}

TEST(HybridQuantizerTest, FusionRepeatsWhenAnAnchorMoves) {
    // C only reaches B, but fusing pulls B within range of A.
    const auto fused = HybridQuantizer::FuseSimilarColors(
        { Entry(100, 100, 100, 0.1f), Entry(121, 100, 100, 0.1f), Entry(113, 116, 100, 0.1f) }, 20.0f);
    ASSERT_EQ(fused.size(), 1u);
    EXPECT_EQ(fused[0].color, RGBColor(111, 105, 100));
    EXPECT_NEAR(fused[0].frequency, 0.3f, 1e-6f);
}

TEST(HybridQuantizerTest, ZeroThresholdFusesNothing) {
    const std::vector<ExtractedColor> input = { Entry(1, 1, 1, 0.5f), Entry(1, 1, 1, 0.5f) };
    EXPECT_EQ(HybridQuantizer::FuseSimilarColors(input, 0.0f).size(), 2u);
}

TEST(HybridQuantizerTest, NoTwoColorsCloserThanThreshold) {
    const float threshold = 40.0f;
    for (TestImageType type : { TestImageType::Natural, TestImageType::Complex, TestImageType::Gradient }) {
        const RgbaImage image = GenerateTestImage(type, 96, 96, 21);
        const ExtractionResult result = MakeQuantizer(4).Quantize(image.GetBuffer(), MakeConfig(10, threshold));

        EXPECT_EQ(result.algorithm, "hybrid");
        EXPECT_GT(result.colors.size(), 0u);
        EXPECT_LE(result.colors.size(), 10u);
        for (size_t i = 0; i < result.colors.size(); ++i) {
            for (size_t j = i + 1; j < result.colors.size(); ++j) {
                EXPECT_GE(ColorMath::RgbDistance(result.colors[i].color, result.colors[j].color), threshold)
                    << GetTestImageName(type) << " colors " << i << " and " << j;
            }
        }
    }
}

TEST(HybridQuantizerTest, SingleColorCollapsesToOne) {
    const RgbaImage image = MakeSolidImage(8, 8, Rgba{ 64, 128, 192, 255 });
    const ExtractionResult result = MakeQuantizer(1).Quantize(image.GetBuffer(), MakeConfig(5));
    ASSERT_EQ(result.colors.size(), 1u);
    EXPECT_EQ(result.colors[0].color, RGBColor(64, 128, 192));
    EXPECT_FLOAT_EQ(result.colors[0].frequency, 1.0f);
}

TEST(HybridQuantizerTest, TransparentImageGivesEmptyResult) {
    const RgbaImage image = MakeSolidImage(4, 4, Rgba{ 255, 0, 0, 0 });
    const ExtractionResult result = MakeQuantizer(1).Quantize(image.GetBuffer(), MakeConfig(6));
    EXPECT_TRUE(result.colors.empty());
    EXPECT_EQ(result.colorCount, 0u);
}

TEST(HybridQuantizerTest, SmallTargetsDependOnPolicy) {
    const RgbaImage image = MakeScenarioA();
    EXPECT_EQ(MakeQuantizer(2, BudgetPolicy::Normalized).Quantize(image.GetBuffer(), MakeConfig(1)).colors.size(), 1u);
    EXPECT_TRUE(MakeQuantizer(2, BudgetPolicy::Floored).Quantize(image.GetBuffer(), MakeConfig(1)).colors.empty());
}

TEST(HybridQuantizerTest, SameSeedSameOutput) {
    const RgbaImage image = GenerateTestImage(TestImageType::Complex, 80, 80, 8);
    const ExtractionConfig config = MakeConfig(9, 25.0f);
    const ExtractionResult a = MakeQuantizer(99).Quantize(image.GetBuffer(), config);
    const ExtractionResult b = MakeQuantizer(99).Quantize(image.GetBuffer(), config);
    ASSERT_EQ(a.colors.size(), b.colors.size());
    for (size_t i = 0; i < a.colors.size(); ++i) {
        EXPECT_EQ(a.colors[i].color, b.colors[i].color);
    }
}
