#pragma once

#include "palette_types.h"
#include <vector>

struct SampledPixel {
    uint32_t x;
    uint32_t y;
    RGBColor color;
    float weight; // importance or edge strength, 0 for grid samples
};

enum class SamplingStrategy {
    Uniform,
    Importance,
    Edge,
    Hybrid
};

struct SamplingParams {
    SamplingStrategy strategy = SamplingStrategy::Hybrid;
    uint32_t sampleCount = 15000;
    float importanceThreshold = 0.1f; // normalized local variation
    float edgeThreshold = 0.3f;       // normalized Sobel magnitude
    int numThreads = 4;
};

// How many pixels a quantizer reads from a buffer.
struct SamplingPlan {
    size_t stride = 1;
    size_t maxSamples = 0;
    bool limitedByMemory = false;
};

class CHROMAQUANT_API PixelSampler {
public:
    // Picks a stride so that at most `maxSamples` pixels are read and the working set
    // (`bytesPerSample` each) stays inside `memoryLimitMB`.
    static SamplingPlan PlanSampling(size_t pixelCount, size_t maxSamples, size_t bytesPerSample, float memoryLimitMB);

    // Reads every `stride`-th pixel whose alpha is non-zero.
    static std::vector<RGBColor> CollectOpaque(const PixelBuffer& buffer, const SamplingPlan& plan);

    // --- Spatial sampling strategies (preprocessing, outside any quantizer) ---
    static std::vector<SampledPixel> Sample(const PixelBuffer& buffer, const SamplingParams& params);
    static std::vector<SampledPixel> UniformSample(const PixelBuffer& buffer, uint32_t sampleCount);
    static std::vector<SampledPixel> ImportanceSample(const PixelBuffer& buffer, uint32_t sampleCount, float threshold, int numThreads);
    static std::vector<SampledPixel> EdgeSample(const PixelBuffer& buffer, uint32_t sampleCount, float threshold, int numThreads);
    static std::vector<SampledPixel> HybridSample(const PixelBuffer& buffer, const SamplingParams& params);

    // Mean color distance to the opaque neighbours, normalized to 0..1. Border and transparent pixels are 0.
    static std::vector<float> ComputeImportanceMap(const PixelBuffer& buffer, int numThreads);
    // Sobel magnitude on luma divided by 255, ignoring transparent neighbours. Border and transparent pixels are 0.
    static std::vector<float> ComputeEdgeMap(const PixelBuffer& buffer, int numThreads);

    static std::vector<SampledPixel> RemoveSpatialDuplicates(const std::vector<SampledPixel>& samples, uint32_t width, uint32_t height);

    // Packs samples into a single-row opaque RGBA image so any quantizer can consume them.
    static std::vector<uint8_t> ToRgbaRow(const std::vector<SampledPixel>& samples);
};
