#include "median_cut_quantizer.h"
#include "color_math.h"
#include <algorithm>

// =================================================================================================
// ColorBox
// =================================================================================================

int ColorBox::GetRange(ColorChannel channel) const {
    if (begin == end) return 0;
    switch (channel) {
    case ColorChannel::Red: return maxR - minR;
    case ColorChannel::Green: return maxG - minG;
    case ColorChannel::Blue: return maxB - minB;
    default: return 0;
    }
}

uint64_t ColorBox::GetVolume() const {
    return static_cast<uint64_t>(GetRange(ColorChannel::Red)) * GetRange(ColorChannel::Green) * GetRange(ColorChannel::Blue);
}

ColorChannel ColorBox::GetLargestDimension() const {
    const int r = GetRange(ColorChannel::Red);
    const int g = GetRange(ColorChannel::Green);
    const int b = GetRange(ColorChannel::Blue);
    if (r >= g && r >= b) return ColorChannel::Red;
    if (g >= b) return ColorChannel::Green;
    return ColorChannel::Blue;
}

bool ColorBox::IsSplittable() const {
    // A single color cannot be cut, however many samples carry it.
    return GetSize() > 1 && (maxR != minR || maxG != minG || maxB != minB);
}

// =================================================================================================
// MedianCutQuantizer
// =================================================================================================

ColorBox MedianCutQuantizer::MakeBox(const std::vector<RGBColor>& samples, size_t begin, size_t end) {
    ColorBox box;
    box.begin = begin;
    box.end = end;
    for (size_t i = begin; i < end; ++i) {
        const RGBColor& c = samples[i];
        box.minR = std::min(box.minR, c.r); box.maxR = std::max(box.maxR, c.r);
        box.minG = std::min(box.minG, c.g); box.maxG = std::max(box.maxG, c.g);
        box.minB = std::min(box.minB, c.b); box.maxB = std::max(box.maxB, c.b);
    }
    return box;
}

RGBColor MedianCutQuantizer::AverageColor(const std::vector<RGBColor>& samples, const ColorBox& box) {
    if (box.GetSize() == 0) return RGBColor();
    uint64_t r = 0, g = 0, b = 0;
    for (size_t i = box.begin; i < box.end; ++i) {
        r += samples[i].r;
        g += samples[i].g;
        b += samples[i].b;
    }
    const double n = static_cast<double>(box.GetSize());
    return RGBColor(ColorMath::ClampToByte(r / n), ColorMath::ClampToByte(g / n), ColorMath::ClampToByte(b / n));
}

std::vector<ColorBox> MedianCutQuantizer::PartitionBoxes(std::vector<RGBColor>& samples, size_t maxBoxes) {
    std::vector<ColorBox> boxes;
    if (samples.empty() || maxBoxes == 0) return boxes;

    boxes.reserve(std::min(maxBoxes, samples.size()));
    boxes.push_back(MakeBox(samples, 0, samples.size()));

    while (boxes.size() < maxBoxes) {
        // Largest volume wins; flat boxes (volume 0) still compete on their widest channel.
        size_t best = boxes.size();
        for (size_t i = 0; i < boxes.size(); ++i) {
            if (!boxes[i].IsSplittable()) continue;
            if (best == boxes.size()) { best = i; continue; }

            const uint64_t volume = boxes[i].GetVolume();
            const uint64_t bestVolume = boxes[best].GetVolume();
            if (volume > bestVolume ||
                (volume == bestVolume &&
                    boxes[i].GetRange(boxes[i].GetLargestDimension()) > boxes[best].GetRange(boxes[best].GetLargestDimension()))) {
                best = i;
            }
        }
        if (best == boxes.size()) break;

        const ColorBox box = boxes[best];
        const ColorChannel channel = box.GetLargestDimension();
        std::stable_sort(samples.begin() + box.begin, samples.begin() + box.end,
            [channel](const RGBColor& a, const RGBColor& b) {
                switch (channel) {
                case ColorChannel::Red: return a.r < b.r;
                case ColorChannel::Green: return a.g < b.g;
                default: return a.b < b.b;
                }
            });

        const size_t median = box.begin + box.GetSize() / 2;
        boxes[best] = MakeBox(samples, box.begin, median);
        boxes.insert(boxes.begin() + best + 1, MakeBox(samples, median, box.end));
    }
    return boxes;
}

size_t MedianCutQuantizer::BytesPerSample() const {
    // Working copy of the sample plus the original.
    return 2 * sizeof(RGBColor);
}

std::vector<ExtractedColor> MedianCutQuantizer::Extract(const std::vector<RGBColor>& samples, const ExtractionConfig& config, uint64_t& memoryBytes) const {
    std::vector<RGBColor> working(samples);
    const std::vector<ColorBox> boxes = PartitionBoxes(working, static_cast<size_t>(config.targetColorCount));

    const float total = static_cast<float>(working.size());
    std::vector<ExtractedColor> colors;
    colors.reserve(boxes.size());
    for (const auto& box : boxes) {
        colors.emplace_back(AverageColor(working, box), box.GetSize() / total);
    }
    std::stable_sort(colors.begin(), colors.end(),
        [](const ExtractedColor& a, const ExtractedColor& b) { return a.frequency > b.frequency; });

    memoryBytes = working.capacity() * sizeof(RGBColor) + boxes.capacity() * sizeof(ColorBox);
    return colors;
}
