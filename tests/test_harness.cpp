#include <gtest/gtest.h>
#include "comparison_harness.h"
#include "octree_quantizer.h"
#include "median_cut_quantizer.h"
#include "test_helpers.h"
#include <stdexcept>

namespace {

    class ThrowingQuantizer : public ColorQuantizer {
    protected:
        std::vector<ExtractedColor> Extract(const std::vector<RGBColor>&, const ExtractionConfig&, uint64_t&) const override {
            throw std::runtime_error("simulated failure");
        }
        size_t BytesPerSample() const override { return sizeof(RGBColor); }

    public:
        const char* Name() const override { return "throwing"; }
    };

    AlgorithmRun MakeRun(const char* name, float score, bool passing, bool succeeded = true) {
        AlgorithmRun run;
        run.algorithm = name;
        run.succeeded = succeeded;
        run.overallScore = score;
        run.result.meetsQualityThreshold = passing;
        return run;
    }

    HarnessOptions SeededOptions() {
        HarnessOptions options;
        options.seed = 12345;
        return options;
    }

}

TEST(ComparisonHarnessTest, RunsAllFourInOrder) {
    const RgbaImage image = GenerateTestImage(TestImageType::Geometric, 128, 128);
    const ComparisonHarness harness(SeededOptions());
    const ComparisonReport report = harness.Compare(image.GetBuffer(), MakeConfig(6));

    ASSERT_EQ(report.runs.size(), 4u);
    EXPECT_EQ(report.runs[0].algorithm, "octree");
    EXPECT_EQ(report.runs[1].algorithm, "median-cut");
    EXPECT_EQ(report.runs[2].algorithm, "improved-kmeans");
    EXPECT_EQ(report.runs[3].algorithm, "hybrid");
    for (const auto& run : report.runs) {
        EXPECT_TRUE(run.succeeded) << run.algorithm << ": " << run.error;
        EXPECT_LE(run.result.colors.size(), 6u);
        EXPECT_FLOAT_EQ(run.overallScore, ComparisonHarness::OverallScore(run.result));
    }
    ASSERT_TRUE(report.HasWinner());
    EXPECT_LT(report.winner, 4u);
}

TEST(ComparisonHarnessTest, FailureDoesNotStopOthers) {
    std::vector<std::unique_ptr<ColorQuantizer>> quantizers;
    quantizers.push_back(std::make_unique<ThrowingQuantizer>());
    quantizers.push_back(std::make_unique<OctreeQuantizer>());
    quantizers.push_back(std::make_unique<MedianCutQuantizer>());
    const ComparisonHarness harness(std::move(quantizers), SeededOptions());

    const RgbaImage image = MakeScenarioA();
    const ComparisonReport report = harness.Compare(image.GetBuffer(), MakeConfig(3));

    ASSERT_EQ(report.runs.size(), 3u);
    EXPECT_FALSE(report.runs[0].succeeded);
    EXPECT_EQ(report.runs[0].error, "simulated failure");
    EXPECT_TRUE(report.runs[1].succeeded);
    EXPECT_TRUE(report.runs[2].succeeded);
    EXPECT_EQ(report.runs[1].result.colors.size(), 3u);
    ASSERT_TRUE(report.HasWinner());
    EXPECT_NE(report.winner, 0u);

    const std::string text = ComparisonHarness::FormatReport(report);
    EXPECT_NE(text.find("FAILED: simulated failure"), std::string::npos);
    EXPECT_NE(text.find("Winner: "), std::string::npos);
}

TEST(ComparisonHarnessTest, AllFailedMeansNoWinner) {
    std::vector<std::unique_ptr<ColorQuantizer>> quantizers;
    quantizers.push_back(std::make_unique<ThrowingQuantizer>());
    quantizers.push_back(std::make_unique<ThrowingQuantizer>());
    const ComparisonHarness harness(std::move(quantizers), SeededOptions());

    const RgbaImage image = MakeScenarioA();
    const ComparisonReport report = harness.Compare(image.GetBuffer(), MakeConfig(2));
    EXPECT_FALSE(report.HasWinner());
    EXPECT_THROW(report.GetWinner(), std::runtime_error);
    EXPECT_NE(ComparisonHarness::FormatReport(report).find("Winner: none"), std::string::npos);
}

TEST(ComparisonHarnessTest, InvalidConfigThrowsBeforeRunning) {
    const ComparisonHarness harness(SeededOptions());
    const RgbaImage image = MakeScenarioA();
    ExtractionConfig config = MakeConfig(3);
    config.maxColorCount = 1;
    EXPECT_THROW(harness.Compare(image.GetBuffer(), config), std::invalid_argument);
}

TEST(ComparisonHarnessTest, OverallScoreWeights) {
    ExtractionResult result;
    result.qualityScore = 1.0f;
    result.extractionTime = 0.0;
    result.memoryUsage = 0;
    EXPECT_FLOAT_EQ(ComparisonHarness::OverallScore(result), 1.0f);

    result.extractionTime = 2000.0;
    EXPECT_FLOAT_EQ(ComparisonHarness::OverallScore(result), 0.7f);

    result.extractionTime = 500.0;
    result.memoryUsage = 50ull * 1024 * 1024;
    EXPECT_NEAR(ComparisonHarness::OverallScore(result), 0.6f + 0.15f + 0.05f, 1e-6f);

    result.memoryUsage = 500ull * 1024 * 1024;
    result.qualityScore = 0.0f;
    EXPECT_NEAR(ComparisonHarness::OverallScore(result), 0.15f, 1e-6f);
}

TEST(ComparisonHarnessTest, WinnerTiesKeepEnumerationOrder) {
    const std::vector<AlgorithmRun> runs = {
        MakeRun("octree", 0.8f, true), MakeRun("median-cut", 0.8f, true),
        MakeRun("improved-kmeans", 0.8f, true), MakeRun("hybrid", 0.8f, true) };
    EXPECT_EQ(ComparisonHarness::SelectWinner(runs), 0u);

    const std::vector<AlgorithmRun> laterBest = {
        MakeRun("octree", 0.5f, true), MakeRun("median-cut", 0.9f, true),
        MakeRun("improved-kmeans", 0.9f, true), MakeRun("hybrid", 0.4f, true) };
    EXPECT_EQ(ComparisonHarness::SelectWinner(laterBest), 1u);
}

TEST(ComparisonHarnessTest, HighestScoreWinsRegardlessOfQualityFlag) {
    const std::vector<AlgorithmRun> runs = {
        MakeRun("octree", 0.95f, false), MakeRun("median-cut", 0.5f, true),
        MakeRun("improved-kmeans", 0.99f, true, false), MakeRun("hybrid", 0.6f, true) };
    EXPECT_EQ(ComparisonHarness::SelectWinner(runs), 0u);

    const std::vector<AlgorithmRun> pair = {
        MakeRun("octree", 0.95f, false), MakeRun("hybrid", 0.60f, true) };
    EXPECT_EQ(ComparisonHarness::SelectWinner(pair), 0u);

    const std::vector<AlgorithmRun> nonePassing = {
        MakeRun("octree", 0.3f, false), MakeRun("median-cut", 0.7f, false) };
    EXPECT_EQ(ComparisonHarness::SelectWinner(nonePassing), 1u);

    const std::vector<AlgorithmRun> allFailed = { MakeRun("octree", 0.0f, false, false) };
    EXPECT_EQ(ComparisonHarness::SelectWinner(allFailed), ComparisonReport::NO_WINNER);
}

TEST(ComparisonHarnessTest, QualityThresholdFlagsResults) {
    const RgbaImage image = MakeScenarioA();
    ExtractionConfig config = MakeConfig(3);
    config.qualityThreshold = 1.0f;
    const ComparisonReport report = ComparisonHarness(SeededOptions()).Compare(image.GetBuffer(), config);
    for (const auto& run : report.runs) {
        ASSERT_TRUE(run.succeeded);
        EXPECT_FALSE(run.result.meetsQualityThreshold);
    }
    // The quality flag does not block a winner.
    EXPECT_TRUE(report.HasWinner());
}
