#pragma once

#include "color_quantizer.h"
#include <vector>

enum class ColorChannel : uint8_t {
    Red = 0,
    Green,
    Blue
};

// A contiguous range [begin, end) of the shared sample array.
struct ColorBox {
    size_t begin = 0;
    size_t end = 0;
    uint8_t minR = 255, maxR = 0;
    uint8_t minG = 255, maxG = 0;
    uint8_t minB = 255, maxB = 0;

    size_t GetSize() const { return end - begin; }
    int GetRange(ColorChannel channel) const;
    uint64_t GetVolume() const;
    // Widest channel; ties resolve R, then G, then B.
    ColorChannel GetLargestDimension() const;
    bool IsSplittable() const;
};

class CHROMAQUANT_API MedianCutQuantizer : public ColorQuantizer {
private:
    static ColorBox MakeBox(const std::vector<RGBColor>& samples, size_t begin, size_t end);
    static RGBColor AverageColor(const std::vector<RGBColor>& samples, const ColorBox& box);

protected:
    std::vector<ExtractedColor> Extract(const std::vector<RGBColor>& samples, const ExtractionConfig& config, uint64_t& memoryBytes) const override;
    size_t BytesPerSample() const override;

public:
    const char* Name() const override { return AlgorithmNames::MedianCut; }

    // Splits `samples` (reordered in place) into at most `maxBoxes` boxes. Stops early
    // once no box can be split.
    static std::vector<ColorBox> PartitionBoxes(std::vector<RGBColor>& samples, size_t maxBoxes);
};
