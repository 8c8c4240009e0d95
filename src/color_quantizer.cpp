#include "color_quantizer.h"
#include "palette_metrics.h"
#include <algorithm>

ExtractionResult ColorQuantizer::Quantize(const PixelBuffer& buffer, const ExtractionConfig& config) const {
    ValidateConfig(config);
    ValidateBuffer(buffer);
    const auto start = std::chrono::steady_clock::now();

    const SamplingPlan plan = PixelSampler::PlanSampling(buffer.GetPixelCount(), MaxSamples(), BytesPerSample(), config.memoryLimit);
    return Run(PixelSampler::CollectOpaque(buffer, plan), config, start);
}

ExtractionResult ColorQuantizer::QuantizeSamples(const std::vector<RGBColor>& samples, const ExtractionConfig& config) const {
    ValidateConfig(config);
    const auto start = std::chrono::steady_clock::now();

    const SamplingPlan plan = PixelSampler::PlanSampling(samples.size(), MaxSamples(), BytesPerSample(), config.memoryLimit);
    if (plan.stride <= 1 && samples.size() <= plan.maxSamples) {
        return Run(samples, config, start);
    }

    std::vector<RGBColor> strided;
    strided.reserve(plan.maxSamples);
    for (size_t i = 0; i < samples.size() && strided.size() < plan.maxSamples; i += plan.stride) {
        strided.push_back(samples[i]);
    }
    return Run(strided, config, start);
}

ExtractionResult ColorQuantizer::Run(const std::vector<RGBColor>& samples, const ExtractionConfig& config, std::chrono::steady_clock::time_point start) const {
    ExtractionResult result;
    result.algorithm = Name();

    uint64_t memoryBytes = samples.capacity() * sizeof(RGBColor);
    if (!samples.empty()) {
        uint64_t algorithmBytes = 0;
        result.colors = Extract(samples, config, algorithmBytes);
        memoryBytes += algorithmBytes;
    }
    if (result.colors.size() > static_cast<size_t>(config.targetColorCount)) {
        result.colors.resize(config.targetColorCount);
    }

    // --- Metrics on the final palette ---
    const std::vector<RGBColor> palette = PaletteMetrics::ColorsOf(result.colors);
    const std::vector<float> representativeness = PaletteMetrics::Representativeness(samples, palette);
    for (size_t i = 0; i < result.colors.size(); ++i) {
        result.colors[i].importance = PaletteMetrics::Importance(palette, i);
        result.colors[i].representativeness = representativeness[i];
    }

    result.qualityScore = PaletteMetrics::QualityScore(result.colors);
    result.meetsQualityThreshold = result.qualityScore >= config.qualityThreshold;
    result.colorCount = static_cast<uint32_t>(result.colors.size());
    result.memoryUsage = memoryBytes + result.colors.capacity() * sizeof(ExtractedColor);

    const auto end = std::chrono::steady_clock::now();
    result.extractionTime = std::chrono::duration<double, std::milli>(end - start).count();
    return result;
}
