#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <cmath>
#include <limits>
#include <stdexcept>

#if defined(_WIN32) || defined(_WIN64)
#if defined(CHROMAQUANT_EXPORT)
#define CHROMAQUANT_API __declspec(dllexport)
#else
#define CHROMAQUANT_API __declspec(dllimport)
#endif
#else
// GCC/Clang: default visibility for shared libs; empty for static.
#if __GNUC__ >= 4
#define CHROMAQUANT_API __attribute__((visibility("default")))
#else
#define CHROMAQUANT_API
#endif
#endif

struct RGBColor {
    uint8_t r;
    uint8_t g;
    uint8_t b;

    RGBColor() : r(0), g(0), b(0) {}
    RGBColor(uint8_t red, uint8_t green, uint8_t blue) : r(red), g(green), b(blue) {}

    bool operator==(const RGBColor& other) const { return r == other.r && g == other.g && b == other.b; }
    bool operator!=(const RGBColor& other) const { return !(*this == other); }
};
static_assert(sizeof(RGBColor) == 3, "RGBColor must stay tightly packed");

struct ExtractedColor {
    RGBColor color;
    float frequency;          // share of processed pixels, 0..1
    float importance;         // separation from the nearest other output color, 0..1
    float representativeness; // coverage of the source distribution, 0..1

    ExtractedColor() : frequency(0.0f), importance(0.0f), representativeness(0.0f) {}
    ExtractedColor(const RGBColor& c, float freq)
        : color(c), frequency(freq), importance(0.0f), representativeness(0.0f) {
    }
};

// Supplied by the caller. There are intentionally no default values here:
// every quantizer rejects a config that was not filled in (see ValidateConfig).
struct ExtractionConfig {
    int targetColorCount;
    int maxColorCount;
    float qualityThreshold;       // 0..1
    float colorDistanceThreshold; // Euclidean RGB units, used by the hybrid fusion step
    float memoryLimit;            // MB
};

struct ExtractionResult {
    std::vector<ExtractedColor> colors;
    std::string algorithm;
    double extractionTime = 0.0; // milliseconds
    float qualityScore = 0.0f;   // 0..1
    uint64_t memoryUsage = 0;    // bytes held by the call's working structures
    uint32_t colorCount = 0;
    bool meetsQualityThreshold = false;
};

// Non-owning view over tightly packed RGBA8 pixels.
struct PixelBuffer {
    const uint8_t* data;
    uint32_t width;
    uint32_t height;

    PixelBuffer() : data(nullptr), width(0), height(0) {}
    PixelBuffer(const uint8_t* pixels, uint32_t w, uint32_t h) : data(pixels), width(w), height(h) {}

    size_t GetPixelCount() const { return static_cast<size_t>(width) * height; }
    size_t GetByteSize() const { return GetPixelCount() * 4; }
    const uint8_t* PixelAt(size_t index) const { return data + index * 4; }
};

struct AlgorithmNames {
    static constexpr const char* Octree = "octree";
    static constexpr const char* MedianCut = "median-cut";
    static constexpr const char* KMeans = "improved-kmeans";
    static constexpr const char* Hybrid = "hybrid";
};

// Throws std::invalid_argument describing the first bad field.
inline void ValidateConfig(const ExtractionConfig& config) {
    if (config.targetColorCount <= 0) {
        throw std::invalid_argument("targetColorCount must be >= 1, got " + std::to_string(config.targetColorCount));
    }
    if (config.maxColorCount < config.targetColorCount) {
        throw std::invalid_argument("maxColorCount (" + std::to_string(config.maxColorCount) +
            ") must be >= targetColorCount (" + std::to_string(config.targetColorCount) + ")");
    }
    if (!(config.qualityThreshold >= 0.0f && config.qualityThreshold <= 1.0f)) {
        throw std::invalid_argument("qualityThreshold must be in [0, 1], got " + std::to_string(config.qualityThreshold));
    }
    if (!(config.colorDistanceThreshold >= 0.0f) || std::isinf(config.colorDistanceThreshold)) {
        throw std::invalid_argument("colorDistanceThreshold must be a finite value >= 0, got " + std::to_string(config.colorDistanceThreshold));
    }
    if (!(config.memoryLimit > 0.0f) || std::isinf(config.memoryLimit)) {
        throw std::invalid_argument("memoryLimit must be a finite number of MB > 0, got " + std::to_string(config.memoryLimit));
    }
}

inline void ValidateBuffer(const PixelBuffer& buffer) {
    if (buffer.width != 0 && buffer.height > std::numeric_limits<size_t>::max() / 4 / buffer.width) {
        throw std::invalid_argument("Pixel buffer dimensions overflow: " + std::to_string(buffer.width) + "x" + std::to_string(buffer.height));
    }
    if (buffer.data == nullptr && buffer.GetPixelCount() != 0) {
        throw std::invalid_argument("Pixel buffer has no data for a " + std::to_string(buffer.width) + "x" + std::to_string(buffer.height) + " image");
    }
}
