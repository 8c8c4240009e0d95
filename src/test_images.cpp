#include "test_images.h"
#include "color_math.h"
#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

void RgbaImage::SetPixel(uint32_t x, uint32_t y, uint8_t r, uint8_t g, uint8_t b, uint8_t a) {
    uint8_t* p = pixels.data() + (static_cast<size_t>(y) * width + x) * 4;
    p[0] = r;
    p[1] = g;
    p[2] = b;
    p[3] = a;
}

namespace {

    void FillGradient(RgbaImage& image) {
        const uint32_t w = image.width;
        const uint32_t h = image.height;
        for (uint32_t y = 0; y < h; ++y) {
            for (uint32_t x = 0; x < w; ++x) {
                image.SetPixel(x, y,
                    static_cast<uint8_t>(std::floor(static_cast<double>(x) / w * 255.0)),
                    static_cast<uint8_t>(std::floor(static_cast<double>(y) / h * 255.0)),
                    static_cast<uint8_t>(std::floor(static_cast<double>(x + y) / (w + h) * 255.0)));
            }
        }
    }

    void FillNatural(RgbaImage& image, std::mt19937& rng) {
        std::uniform_real_distribution<double> jitter(0.0, 40.0);
        for (uint32_t y = 0; y < image.height; ++y) {
            for (uint32_t x = 0; x < image.width; ++x) {
                const double noise1 = std::sin(x * 0.05) * std::cos(y * 0.03);
                const double noise2 = std::sin(x * 0.02 + y * 0.04);
                const double r = 128.0 + noise1 * 60.0 + jitter(rng);
                const double g = 100.0 + noise2 * 80.0 + jitter(rng);
                const double b = 80.0 + noise1 * noise2 * 100.0 + jitter(rng);
                image.SetPixel(x, y, ColorMath::ClampToByte(std::floor(r)), ColorMath::ClampToByte(std::floor(g)), ColorMath::ClampToByte(std::floor(b)));
            }
        }
    }

    void FillGeometric(RgbaImage& image) {
        const double w = image.width;
        const double h = image.height;
        for (uint32_t y = 0; y < image.height; ++y) {
            for (uint32_t x = 0; x < image.width; ++x) {
                const bool circle1 = std::hypot(x - w / 3.0, y - h / 3.0) < 50.0;
                const bool circle2 = std::hypot(x - 2.0 * w / 3.0, y - 2.0 * h / 3.0) < 40.0;
                const bool stripes = (x / 20) % 2 == 0;

                if (circle1) image.SetPixel(x, y, 255, 100, 100);
                else if (circle2) image.SetPixel(x, y, 100, 255, 100);
                else if (stripes) image.SetPixel(x, y, 100, 100, 255);
                else image.SetPixel(x, y, 128, 128, 128);
            }
        }
    }

    void FillComplex(RgbaImage& image, std::mt19937& rng) {
        std::uniform_real_distribution<double> noiseDist(-25.0, 25.0);
        const double w = image.width;
        const double h = image.height;
        for (uint32_t y = 0; y < image.height; ++y) {
            for (uint32_t x = 0; x < image.width; ++x) {
                const double baseR = std::floor(x / w * 255.0);
                const double baseG = std::floor(y / h * 255.0);
                const double baseB = std::floor((x + y) / (w + h) * 255.0);

                const bool circle = std::hypot(x - w / 2.0, y - h / 2.0) < 60.0;
                const bool stripes = ((x + y) / 15) % 2 == 0;
                const double noise = noiseDist(rng);

                double r = baseR, g = baseG, b = baseB;
                if (circle && stripes) {
                    r = std::min(255.0, baseR + 100.0);
                    g = std::min(255.0, baseG - 50.0);
                }
                else if (circle) {
                    g = std::min(255.0, baseG + 80.0);
                }
                else if (stripes) {
                    b = std::min(255.0, baseB + 70.0);
                }
                image.SetPixel(x, y, ColorMath::ClampToByte(std::floor(r + noise)), ColorMath::ClampToByte(std::floor(g + noise)), ColorMath::ClampToByte(std::floor(b + noise)));
            }
        }
    }

}

RgbaImage GenerateTestImage(TestImageType type, uint32_t width, uint32_t height, uint32_t seed) {
    RgbaImage image(width, height);
    std::mt19937 rng(seed);
    switch (type) {
    case TestImageType::Gradient:
        FillGradient(image);
        break;
    case TestImageType::Natural:
        FillNatural(image, rng);
        break;
    case TestImageType::Geometric:
        FillGeometric(image);
        break;
    case TestImageType::Complex:
        FillComplex(image, rng);
        break;
    }
    return image;
}

const char* GetTestImageName(TestImageType type) {
    switch (type) {
    case TestImageType::Gradient: return "gradient";
    case TestImageType::Natural: return "natural";
    case TestImageType::Geometric: return "geometric";
    case TestImageType::Complex: return "complex";
    default: return "unknown";
    }
}

TestImageType ParseTestImageType(const std::string& name) {
    if (name == "gradient") return TestImageType::Gradient;
    if (name == "natural") return TestImageType::Natural;
    if (name == "geometric") return TestImageType::Geometric;
    if (name == "complex") return TestImageType::Complex;
    throw std::invalid_argument("Unknown test image type: " + name);
}
