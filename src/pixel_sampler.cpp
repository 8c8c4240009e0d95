#include "pixel_sampler.h"
#include "color_math.h"
#include <algorithm>
#include <cmath>

// =================================================================================================
// Opaque sample collection
// =================================================================================================

SamplingPlan PixelSampler::PlanSampling(size_t pixelCount, size_t maxSamples, size_t bytesPerSample, float memoryLimitMB) {
    SamplingPlan plan;
    if (pixelCount == 0) return plan;

    size_t budget = (maxSamples == 0) ? pixelCount : std::min(pixelCount, maxSamples);

    // Compared in double: a large limit does not fit in size_t.
    const double limitBytes = static_cast<double>(memoryLimitMB) * 1024.0 * 1024.0;
    const double memorySamples = limitBytes / static_cast<double>(std::max<size_t>(1, bytesPerSample));
    if (memorySamples < static_cast<double>(budget)) {
        budget = std::max<size_t>(1, static_cast<size_t>(memorySamples));
        plan.limitedByMemory = true;
    }

    plan.maxSamples = budget;
    plan.stride = (pixelCount + budget - 1) / budget;
    return plan;
}

std::vector<RGBColor> PixelSampler::CollectOpaque(const PixelBuffer& buffer, const SamplingPlan& plan) {
    std::vector<RGBColor> samples;
    const size_t pixelCount = buffer.GetPixelCount();
    if (pixelCount == 0 || plan.maxSamples == 0) return samples;

    const size_t stride = std::max<size_t>(1, plan.stride);
    samples.reserve(std::min(plan.maxSamples, (pixelCount + stride - 1) / stride));

    for (size_t i = 0; i < pixelCount && samples.size() < plan.maxSamples; i += stride) {
        const uint8_t* p = buffer.PixelAt(i);
        if (p[3] > 0) {
            samples.emplace_back(p[0], p[1], p[2]);
        }
    }
    return samples;
}

// =================================================================================================
// Importance / edge maps
// =================================================================================================

std::vector<float> PixelSampler::ComputeImportanceMap(const PixelBuffer& buffer, int numThreads) {
    const int64_t width = buffer.width;
    const int64_t height = buffer.height;
    std::vector<float> importance(buffer.GetPixelCount(), 0.0f);
    if (width < 3 || height < 3) return importance;

#pragma omp parallel for num_threads(numThreads)
    for (int64_t y = 1; y < height - 1; ++y) {
        for (int64_t x = 1; x < width - 1; ++x) {
            const uint8_t* c = buffer.PixelAt(y * width + x);
            if (c[3] == 0) continue;

            float totalVariation = 0.0f;
            int neighbours = 0;
            for (int dy = -1; dy <= 1; ++dy) {
                for (int dx = -1; dx <= 1; ++dx) {
                    if (dx == 0 && dy == 0) continue;
                    const uint8_t* n = buffer.PixelAt((y + dy) * width + (x + dx));
                    if (n[3] == 0) continue;
                    const float dr = static_cast<float>(c[0]) - n[0];
                    const float dg = static_cast<float>(c[1]) - n[1];
                    const float db = static_cast<float>(c[2]) - n[2];
                    totalVariation += std::sqrt(dr * dr + dg * dg + db * db);
                    neighbours++;
                }
            }
            if (neighbours > 0) {
                importance[y * width + x] = totalVariation / (neighbours * ColorMath::MAX_RGB_DISTANCE);
            }
        }
    }
    return importance;
}

std::vector<float> PixelSampler::ComputeEdgeMap(const PixelBuffer& buffer, int numThreads) {
    static const int sobelX[3][3] = { { -1, 0, 1 }, { -2, 0, 2 }, { -1, 0, 1 } };
    static const int sobelY[3][3] = { { -1, -2, -1 }, { 0, 0, 0 }, { 1, 2, 1 } };

    const int64_t width = buffer.width;
    const int64_t height = buffer.height;
    std::vector<float> edges(buffer.GetPixelCount(), 0.0f);
    if (width < 3 || height < 3) return edges;

#pragma omp parallel for num_threads(numThreads)
    for (int64_t y = 1; y < height - 1; ++y) {
        for (int64_t x = 1; x < width - 1; ++x) {
            const uint8_t* c = buffer.PixelAt(y * width + x);
            if (c[3] == 0) continue;

            // Transparent neighbours take the center luma, so they add no gradient.
            const float centerLuma = ColorMath::Luma601(c);
            float gx = 0.0f;
            float gy = 0.0f;
            for (int ky = 0; ky < 3; ++ky) {
                for (int kx = 0; kx < 3; ++kx) {
                    const uint8_t* n = buffer.PixelAt((y + ky - 1) * width + (x + kx - 1));
                    const float luma = n[3] == 0 ? centerLuma : ColorMath::Luma601(n);
                    gx += luma * sobelX[ky][kx];
                    gy += luma * sobelY[ky][kx];
                }
            }
            edges[y * width + x] = std::sqrt(gx * gx + gy * gy) / 255.0f;
        }
    }
    return edges;
}

// =================================================================================================
// Sampling strategies
// =================================================================================================

std::vector<SampledPixel> PixelSampler::UniformSample(const PixelBuffer& buffer, uint32_t sampleCount) {
    std::vector<SampledPixel> samples;
    if (buffer.GetPixelCount() == 0 || sampleCount == 0) return samples;

    const double gridSize = std::sqrt(static_cast<double>(sampleCount));
    const double stepX = buffer.width / gridSize;
    const double stepY = buffer.height / gridSize;
    const int cells = static_cast<int>(std::ceil(gridSize));

    for (int i = 0; i < cells; ++i) {
        for (int j = 0; j < cells; ++j) {
            const uint32_t x = static_cast<uint32_t>(std::floor(i * stepX + stepX / 2.0));
            const uint32_t y = static_cast<uint32_t>(std::floor(j * stepY + stepY / 2.0));
            if (x >= buffer.width || y >= buffer.height) continue;

            const uint8_t* p = buffer.PixelAt(static_cast<size_t>(y) * buffer.width + x);
            if (p[3] == 0) continue;
            samples.push_back({ x, y, RGBColor(p[0], p[1], p[2]), 0.0f });
            if (samples.size() >= sampleCount) return samples;
        }
    }
    return samples;
}

namespace {

    // Keeps the `count` strongest pixels above `threshold`, strongest first.
    std::vector<SampledPixel> SelectStrongest(const PixelBuffer& buffer, const std::vector<float>& map, uint32_t count, float threshold) {
        std::vector<SampledPixel> candidates;
        for (uint32_t y = 1; y + 1 < buffer.height; ++y) {
            for (uint32_t x = 1; x + 1 < buffer.width; ++x) {
                const size_t idx = static_cast<size_t>(y) * buffer.width + x;
                const uint8_t* p = buffer.PixelAt(idx);
                if (map[idx] > threshold && p[3] > 0) {
                    candidates.push_back({ x, y, RGBColor(p[0], p[1], p[2]), map[idx] });
                }
            }
        }
        std::stable_sort(candidates.begin(), candidates.end(),
            [](const SampledPixel& a, const SampledPixel& b) { return a.weight > b.weight; });
        if (candidates.size() > count) candidates.resize(count);
        return candidates;
    }

}

std::vector<SampledPixel> PixelSampler::ImportanceSample(const PixelBuffer& buffer, uint32_t sampleCount, float threshold, int numThreads) {
    if (buffer.GetPixelCount() == 0 || sampleCount == 0) return {};
    return SelectStrongest(buffer, ComputeImportanceMap(buffer, numThreads), sampleCount, threshold);
}

std::vector<SampledPixel> PixelSampler::EdgeSample(const PixelBuffer& buffer, uint32_t sampleCount, float threshold, int numThreads) {
    if (buffer.GetPixelCount() == 0 || sampleCount == 0) return {};
    return SelectStrongest(buffer, ComputeEdgeMap(buffer, numThreads), sampleCount, threshold);
}

std::vector<SampledPixel> PixelSampler::RemoveSpatialDuplicates(const std::vector<SampledPixel>& samples, uint32_t width, uint32_t height) {
    std::vector<SampledPixel> result;
    if (samples.empty()) return result;

    const double minDistance = std::sqrt(static_cast<double>(width) * height / samples.size()) * 0.5;
    const double minDistanceSq = minDistance * minDistance;

    for (const auto& sample : samples) {
        bool tooClose = false;
        for (const auto& kept : result) {
            const double dx = static_cast<double>(sample.x) - kept.x;
            const double dy = static_cast<double>(sample.y) - kept.y;
            if (dx * dx + dy * dy < minDistanceSq) { tooClose = true; break; }
        }
        if (!tooClose) result.push_back(sample);
    }
    return result;
}

std::vector<SampledPixel> PixelSampler::HybridSample(const PixelBuffer& buffer, const SamplingParams& params) {
    const uint32_t uniformCount = static_cast<uint32_t>(std::floor(params.sampleCount * 0.4));
    const uint32_t importanceCount = static_cast<uint32_t>(std::floor(params.sampleCount * 0.3));
    const uint32_t edgeCount = params.sampleCount - uniformCount - importanceCount;

    std::vector<SampledPixel> samples = UniformSample(buffer, uniformCount);
    auto important = ImportanceSample(buffer, importanceCount, params.importanceThreshold, params.numThreads);
    samples.insert(samples.end(), important.begin(), important.end());
    auto edges = EdgeSample(buffer, edgeCount, params.edgeThreshold, params.numThreads);
    samples.insert(samples.end(), edges.begin(), edges.end());

    return RemoveSpatialDuplicates(samples, buffer.width, buffer.height);
}

std::vector<SampledPixel> PixelSampler::Sample(const PixelBuffer& buffer, const SamplingParams& params) {
    ValidateBuffer(buffer);
    switch (params.strategy) {
    case SamplingStrategy::Uniform:
        return UniformSample(buffer, params.sampleCount);
    case SamplingStrategy::Importance:
        return ImportanceSample(buffer, params.sampleCount, params.importanceThreshold, params.numThreads);
    case SamplingStrategy::Edge:
        return EdgeSample(buffer, params.sampleCount, params.edgeThreshold, params.numThreads);
    case SamplingStrategy::Hybrid:
    default:
        return HybridSample(buffer, params);
    }
}

std::vector<uint8_t> PixelSampler::ToRgbaRow(const std::vector<SampledPixel>& samples) {
    std::vector<uint8_t> rgba(samples.size() * 4);
    for (size_t i = 0; i < samples.size(); ++i) {
        rgba[i * 4 + 0] = samples[i].color.r;
        rgba[i * 4 + 1] = samples[i].color.g;
        rgba[i * 4 + 2] = samples[i].color.b;
        rgba[i * 4 + 3] = 255;
    }
    return rgba;
}
