#pragma once

#include "color_quantizer.h"
#include "hybrid_quantizer.h"
#include <memory>
#include <string>
#include <vector>

struct HarnessOptions {
    bool verbose = false; // progress lines on std::cout
    uint32_t seed = 0; // shared by k-means and hybrid
    BudgetPolicy hybridPolicy = BudgetPolicy::Normalized;
};

struct AlgorithmRun {
    std::string algorithm;
    bool succeeded = false;
    std::string error;
    ExtractionResult result;
    float overallScore = 0.0f;
};

struct ComparisonReport {
    static constexpr size_t NO_WINNER = static_cast<size_t>(-1);

    std::vector<AlgorithmRun> runs; // in enumeration order
    size_t winner = NO_WINNER;

    bool HasWinner() const { return winner != NO_WINNER; }
    const AlgorithmRun& GetWinner() const;
};

class CHROMAQUANT_API ComparisonHarness {
private:
    std::vector<std::unique_ptr<ColorQuantizer>> quantizers;
    HarnessOptions options;

public:
    // Octree, median-cut, k-means and hybrid, in that order.
    explicit ComparisonHarness(const HarnessOptions& opts = HarnessOptions());
    ComparisonHarness(std::vector<std::unique_ptr<ColorQuantizer>> customQuantizers, const HarnessOptions& opts = HarnessOptions());

    // Runs every quantizer on the same input. A quantizer that throws is recorded as failed
    // and the others still run. An invalid config or buffer throws before anything runs.
    ComparisonReport Compare(const PixelBuffer& buffer, const ExtractionConfig& config) const;

    // 0.6 quality + 0.3 speed (1 s scale) + 0.1 memory (100 MB scale)
    static float OverallScore(const ExtractionResult& result);

    // Best overall score among successful runs. Earlier runs win ties.
    static size_t SelectWinner(const std::vector<AlgorithmRun>& runs);

    static std::string FormatReport(const ComparisonReport& report);
};
