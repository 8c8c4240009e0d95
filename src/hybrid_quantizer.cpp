#include "hybrid_quantizer.h"
#include "color_math.h"
#include <algorithm>
#include <cmath>
#include <utility>

HybridQuantizer::HybridQuantizer(const HybridOptions& opts)
    : options(opts), kmeans(opts.kmeans) {
}

HybridBudgets HybridQuantizer::SplitBudget(int targetColorCount, BudgetPolicy policy) {
    HybridBudgets budgets;
    if (targetColorCount <= 0) return budgets;

    budgets.octree = static_cast<int>(std::floor(targetColorCount * 0.4));
    budgets.medianCut = static_cast<int>(std::floor(targetColorCount * 0.3));
    if (policy == BudgetPolicy::Floored) {
        budgets.kmeans = static_cast<int>(std::floor(targetColorCount * 0.3));
    }
    else {
        budgets.kmeans = targetColorCount - budgets.octree - budgets.medianCut;
    }
    return budgets;
}

float HybridQuantizer::RankScore(const ExtractedColor& color) {
    return 0.4f * color.importance + 0.4f * color.representativeness + 0.2f * color.frequency;
}

// =================================================================================================
// Fusion
// =================================================================================================

namespace {

    void FuseInto(ExtractedColor& anchor, const ExtractedColor& other) {
        const float totalWeight = anchor.frequency + other.frequency;
        const double wa = totalWeight > 0.0f ? anchor.frequency / totalWeight : 0.5;
        const double wo = totalWeight > 0.0f ? other.frequency / totalWeight : 0.5;

        anchor.color = RGBColor(
            ColorMath::ClampToByte(anchor.color.r * wa + other.color.r * wo),
            ColorMath::ClampToByte(anchor.color.g * wa + other.color.g * wo),
            ColorMath::ClampToByte(anchor.color.b * wa + other.color.b * wo));
        anchor.frequency = totalWeight;
        anchor.importance = std::max(anchor.importance, other.importance);
        anchor.representativeness = std::max(anchor.representativeness, other.representativeness);
    }

    // One greedy pass. Returns true if anything was fused.
    bool FusePass(const std::vector<ExtractedColor>& input, std::vector<ExtractedColor>& output, float threshold) {
        output.clear();
        output.reserve(input.size());
        bool fused = false;
        for (const auto& candidate : input) {
            auto it = std::find_if(output.begin(), output.end(), [&](const ExtractedColor& accepted) {
                return ColorMath::RgbDistance(candidate.color, accepted.color) < threshold;
                });
            if (it != output.end()) {
                FuseInto(*it, candidate);
                fused = true;
            }
            else {
                output.push_back(candidate);
            }
        }
        return fused;
    }

}

std::vector<ExtractedColor> HybridQuantizer::FuseSimilarColors(const std::vector<ExtractedColor>& colors, float threshold) {
    std::vector<ExtractedColor> current = colors;
    std::vector<ExtractedColor> next;
    while (FusePass(current, next, threshold)) {
        current.swap(next);
    }
    return next;
}

// =================================================================================================
// Extraction
// =================================================================================================

size_t HybridQuantizer::BytesPerSample() const {
    // Held samples plus the largest per-sample cost among the components (octree).
    return 2 * sizeof(RGBColor) + sizeof(OctreeNode);
}

std::vector<ExtractedColor> HybridQuantizer::Extract(const std::vector<RGBColor>& samples, const ExtractionConfig& config, uint64_t& memoryBytes) const {
    const HybridBudgets budgets = SplitBudget(config.targetColorCount, options.policy);
    const std::pair<const ColorQuantizer*, int> components[] = {
        { &octree, budgets.octree },
        { &medianCut, budgets.medianCut },
        { &kmeans, budgets.kmeans },
    };

    std::vector<ExtractedColor> combined;
    int componentsRun = 0;
    memoryBytes = 0;
    for (const auto& component : components) {
        if (component.second <= 0) continue;

        ExtractionConfig subConfig = config;
        subConfig.targetColorCount = component.second;
        subConfig.maxColorCount = component.second;
        const ExtractionResult sub = component.first->QuantizeSamples(samples, subConfig);

        combined.insert(combined.end(), sub.colors.begin(), sub.colors.end());
        memoryBytes += sub.memoryUsage;
        componentsRun++;
    }
    if (combined.empty()) return combined;

    std::vector<ExtractedColor> fused = FuseSimilarColors(combined, config.colorDistanceThreshold);
    std::stable_sort(fused.begin(), fused.end(),
        [](const ExtractedColor& a, const ExtractedColor& b) { return RankScore(a) > RankScore(b); });
    if (fused.size() > static_cast<size_t>(config.targetColorCount)) {
        fused.resize(config.targetColorCount);
    }

    // Each component counted every sample once.
    for (auto& color : fused) {
        color.frequency /= static_cast<float>(componentsRun);
    }

    memoryBytes += combined.capacity() * sizeof(ExtractedColor) + fused.capacity() * sizeof(ExtractedColor);
    return fused;
}
