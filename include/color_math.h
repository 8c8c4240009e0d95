#pragma once

#include "palette_types.h"
#include <cmath>
#include <algorithm>
#include <cstdio>
#include <cctype>
#include <string>
#include <colorm.h>

struct LabColor {
    float l; // 0..100
    float a;
    float b;
};

struct HsvColor {
    float h; // 0..360
    float s; // 0..100
    float v; // 0..100
};

namespace ColorMath {

    // Largest possible Euclidean distance inside the RGB cube.
    static constexpr float MAX_RGB_DISTANCE = 441.67295593f; // 255 * sqrt(3)

    // -----------------------------
    // RGB distances
    // -----------------------------

    static inline int RgbDistanceSq(const RGBColor& a, const RGBColor& b) {
        const int dr = static_cast<int>(a.r) - static_cast<int>(b.r);
        const int dg = static_cast<int>(a.g) - static_cast<int>(b.g);
        const int db = static_cast<int>(a.b) - static_cast<int>(b.b);
        return dr * dr + dg * dg + db * db;
    }

    static inline float RgbDistance(const RGBColor& a, const RGBColor& b) {
        return std::sqrt(static_cast<float>(RgbDistanceSq(a, b)));
    }

    static inline uint8_t ClampToByte(double v) {
        return static_cast<uint8_t>(std::min(255.0, std::max(0.0, std::round(v))));
    }

    // -----------------------------
    // Per-color conversions (colorm)
    // -----------------------------

    static inline colorm::Rgb ToColorm(const RGBColor& rgb) {
        colorm::Rgb c;
        c.setRed8(rgb.r).setGreen8(rgb.g).setBlue8(rgb.b);
        return c;
    }

    static inline LabColor RgbToLab(const RGBColor& rgb) {
        const colorm::Lab lab_color(ToColorm(rgb));
        LabColor lab;
        lab.l = static_cast<float>(lab_color.lightness());
        lab.a = static_cast<float>(lab_color.a());
        lab.b = static_cast<float>(lab_color.b());
        return lab;
    }

    // CIE76
    static inline float DeltaE(const LabColor& a, const LabColor& b) {
        const float dl = a.l - b.l;
        const float da = a.a - b.a;
        const float db = a.b - b.b;
        return std::sqrt(dl * dl + da * da + db * db);
    }

    // Hue from colorm's HSL (shared with HSV), value and saturation from the 0..1 channels.
    static inline HsvColor RgbToHsv(const RGBColor& rgb) {
        const colorm::Rgb c = ToColorm(rgb);
        const colorm::Hsl hsl(c);
        const float maxC = static_cast<float>(std::max({ c.red(), c.green(), c.blue() }));
        const float minC = static_cast<float>(std::min({ c.red(), c.green(), c.blue() }));

        HsvColor hsv;
        const float hue = static_cast<float>(hsl.hue());
        hsv.h = (std::isnan(hue) || maxC == minC) ? 0.0f : std::fmod(hue + 360.0f, 360.0f);
        hsv.s = maxC == 0.0f ? 0.0f : ((maxC - minC) / maxC) * 100.0f;
        hsv.v = maxC * 100.0f;
        return hsv;
    }

    // Relative luminance Y (0..1), recovered from CIE lightness.
    static inline float Luminance(const RGBColor& rgb) {
        const float l = RgbToLab(rgb).l;
        const float y = l > 8.0f ? std::pow((l + 16.0f) / 116.0f, 3.0f) : l / 903.3f;
        return std::min(1.0f, std::max(0.0f, y));
    }

    // BT.601 luma on 0..255 values, used for edge detection.
    static inline float Luma601(const uint8_t* rgba) {
        return 0.299f * rgba[0] + 0.587f * rgba[1] + 0.114f * rgba[2];
    }

    // -----------------------------
    // Hex strings
    // -----------------------------

    static inline std::string ToHex(const RGBColor& rgb) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", rgb.r, rgb.g, rgb.b);
        return std::string(buf);
    }

    // Accepts "#rrggbb" or "rrggbb". Returns false on malformed input.
    static inline bool FromHex(const std::string& hex, RGBColor& out) {
        std::string digits = (!hex.empty() && hex[0] == '#') ? hex.substr(1) : hex;
        if (digits.size() != 6) return false;
        for (char c : digits) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
        }
        const unsigned long value = std::stoul(digits, nullptr, 16);
        out = RGBColor(static_cast<uint8_t>((value >> 16) & 0xff), static_cast<uint8_t>((value >> 8) & 0xff), static_cast<uint8_t>(value & 0xff));
        return true;
    }

} // namespace ColorMath
