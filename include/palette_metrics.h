#pragma once

#include "palette_types.h"
#include <vector>

struct PaintingAnalysis {
    // Grouped by WCAG luminance: light > 0.7, mid > 0.3, dark otherwise.
    std::vector<RGBColor> light;
    std::vector<RGBColor> mid;
    std::vector<RGBColor> dark;

    // Grouped by HSV hue: warm 0-60 / 300-360, cool 180-240, neutral otherwise.
    std::vector<RGBColor> warm;
    std::vector<RGBColor> neutral;
    std::vector<RGBColor> cool;

    float diversity = 0.0f; // mean pairwise CIE76 delta E / 50
    float coverage = 0.0f;  // luminance range
};

class CHROMAQUANT_API PaletteMetrics {
public:
    // Distance to the nearest other color / (255 * sqrt(3)), clamped to 1. A lone color scores 1.
    static float Importance(const std::vector<RGBColor>& colors, size_t index);

    // For every color: 1 - mean distance of the samples it is nearest to, normalized; 0 if it covers none.
    static std::vector<float> Representativeness(const std::vector<RGBColor>& samples, const std::vector<RGBColor>& colors);

    // Mean pairwise RGB distance / (255 * sqrt(3)), clamped to 1. Fewer than two colors score 0.
    static float QualityScore(const std::vector<ExtractedColor>& colors);

    // Index of the nearest palette entry; ties go to the lower index.
    static size_t NearestIndex(const RGBColor& color, const std::vector<RGBColor>& palette);

    static PaintingAnalysis AnalyzePaintingColors(const std::vector<RGBColor>& colors);

    static std::vector<RGBColor> ColorsOf(const std::vector<ExtractedColor>& colors);
};
