#include "palette_metrics.h"
#include "color_math.h"
#include <algorithm>
#include <cmath>
#include <limits>

float PaletteMetrics::Importance(const std::vector<RGBColor>& colors, size_t index) {
    int minDistSq = std::numeric_limits<int>::max();
    for (size_t j = 0; j < colors.size(); ++j) {
        if (j == index) continue;
        minDistSq = std::min(minDistSq, ColorMath::RgbDistanceSq(colors[index], colors[j]));
    }
    if (minDistSq == std::numeric_limits<int>::max()) return 1.0f;
    return std::min(std::sqrt(static_cast<float>(minDistSq)) / ColorMath::MAX_RGB_DISTANCE, 1.0f);
}

size_t PaletteMetrics::NearestIndex(const RGBColor& color, const std::vector<RGBColor>& palette) {
    size_t best = 0;
    int bestDistSq = std::numeric_limits<int>::max();
    for (size_t i = 0; i < palette.size(); ++i) {
        const int d = ColorMath::RgbDistanceSq(color, palette[i]);
        if (d < bestDistSq) { bestDistSq = d; best = i; }
    }
    return best;
}

std::vector<float> PaletteMetrics::Representativeness(const std::vector<RGBColor>& samples, const std::vector<RGBColor>& colors) {
    std::vector<float> result(colors.size(), 0.0f);
    if (colors.empty() || samples.empty()) return result;

    std::vector<double> distanceSums(colors.size(), 0.0);
    std::vector<uint64_t> counts(colors.size(), 0);
    for (const auto& sample : samples) {
        const size_t nearest = NearestIndex(sample, colors);
        distanceSums[nearest] += ColorMath::RgbDistance(sample, colors[nearest]);
        counts[nearest]++;
    }

    for (size_t i = 0; i < colors.size(); ++i) {
        if (counts[i] == 0) continue;
        const double meanDistance = distanceSums[i] / static_cast<double>(counts[i]);
        result[i] = static_cast<float>(std::max(0.0, 1.0 - meanDistance / ColorMath::MAX_RGB_DISTANCE));
    }
    return result;
}

float PaletteMetrics::QualityScore(const std::vector<ExtractedColor>& colors) {
    if (colors.size() < 2) return 0.0f;

    double totalDistance = 0.0;
    size_t comparisons = 0;
    for (size_t i = 0; i < colors.size(); ++i) {
        for (size_t j = i + 1; j < colors.size(); ++j) {
            totalDistance += ColorMath::RgbDistance(colors[i].color, colors[j].color);
            comparisons++;
        }
    }
    const double avgDistance = totalDistance / static_cast<double>(comparisons);
    return static_cast<float>(std::min(avgDistance / ColorMath::MAX_RGB_DISTANCE, 1.0));
}

std::vector<RGBColor> PaletteMetrics::ColorsOf(const std::vector<ExtractedColor>& colors) {
    std::vector<RGBColor> out;
    out.reserve(colors.size());
    for (const auto& c : colors) out.push_back(c.color);
    return out;
}

PaintingAnalysis PaletteMetrics::AnalyzePaintingColors(const std::vector<RGBColor>& colors) {
    PaintingAnalysis analysis;
    if (colors.empty()) return analysis;

    float minLum = 1.0f;
    float maxLum = 0.0f;
    for (const auto& color : colors) {
        const float luminance = ColorMath::Luminance(color);
        minLum = std::min(minLum, luminance);
        maxLum = std::max(maxLum, luminance);
        if (luminance > 0.7f) analysis.light.push_back(color);
        else if (luminance > 0.3f) analysis.mid.push_back(color);
        else analysis.dark.push_back(color);

        const HsvColor hsv = ColorMath::RgbToHsv(color);
        if ((hsv.h >= 0.0f && hsv.h <= 60.0f) || (hsv.h >= 300.0f && hsv.h <= 360.0f)) analysis.warm.push_back(color);
        else if (hsv.h >= 180.0f && hsv.h <= 240.0f) analysis.cool.push_back(color);
        else analysis.neutral.push_back(color);
    }

    std::vector<LabColor> labs;
    labs.reserve(colors.size());
    for (const auto& color : colors) labs.push_back(ColorMath::RgbToLab(color));

    double totalDeltaE = 0.0;
    size_t pairs = 0;
    for (size_t i = 0; i < labs.size(); ++i) {
        for (size_t j = i + 1; j < labs.size(); ++j) {
            totalDeltaE += ColorMath::DeltaE(labs[i], labs[j]);
            pairs++;
        }
    }
    analysis.diversity = pairs > 0 ? static_cast<float>(totalDeltaE / pairs / 50.0) : 0.0f;
    analysis.coverage = maxLum - minLum;
    return analysis;
}
