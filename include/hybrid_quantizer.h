#pragma once

#include "color_quantizer.h"
#include "octree_quantizer.h"
#include "median_cut_quantizer.h"
#include "kmeans_quantizer.h"
#include <vector>

enum class BudgetPolicy {
    Floored,   // floor(40%), floor(30%), floor(30%); may fall up to two colors short
    Normalized // k-means takes whatever the other two leave
};

struct HybridOptions {
    BudgetPolicy policy = BudgetPolicy::Normalized;
    KMeansOptions kmeans;
};

struct HybridBudgets {
    int octree = 0;
    int medianCut = 0;
    int kmeans = 0;
};

class CHROMAQUANT_API HybridQuantizer : public ColorQuantizer {
private:
    HybridOptions options;
    OctreeQuantizer octree;
    MedianCutQuantizer medianCut;
    KMeansQuantizer kmeans;

protected:
    std::vector<ExtractedColor> Extract(const std::vector<RGBColor>& samples, const ExtractionConfig& config, uint64_t& memoryBytes) const override;
    size_t BytesPerSample() const override;

public:
    explicit HybridQuantizer(const HybridOptions& opts = HybridOptions());

    const char* Name() const override { return AlgorithmNames::Hybrid; }

    static HybridBudgets SplitBudget(int targetColorCount, BudgetPolicy policy);

    // Greedy fusion in input order: a color closer than `threshold` to an accepted entry is
    // folded into the first such entry (frequency-weighted). Repeats until nothing fuses, so
    // no two returned colors are closer than `threshold`.
    static std::vector<ExtractedColor> FuseSimilarColors(const std::vector<ExtractedColor>& colors, float threshold);

    static float RankScore(const ExtractedColor& color);
};
