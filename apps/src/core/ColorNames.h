#pragma once
#include <algorithm>
#include <cmath>
#include <cstdint>

// Packed RGBA (0xRRGGBBAA) utilities for display tints.
namespace ColorNames {

// Pack components (0-255) into RGBA.
inline uint32_t rgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
{
    return (static_cast<uint32_t>(r) << 24) | (static_cast<uint32_t>(g) << 16)
        | (static_cast<uint32_t>(b) << 8) | static_cast<uint32_t>(a);
}

// Pack float components (0.0-1.0) into RGBA, clamping out-of-range values.
inline uint32_t rgbaF(float r, float g, float b, float a = 1.0f)
{
    auto clamp = [](float v) -> uint8_t {
        return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f));
    };
    return rgba(clamp(r), clamp(g), clamp(b), clamp(a));
}

// Extract components (0-255).
inline uint8_t getR(uint32_t color)
{
    return (color >> 24) & 0xFF;
}
inline uint8_t getG(uint32_t color)
{
    return (color >> 16) & 0xFF;
}
inline uint8_t getB(uint32_t color)
{
    return (color >> 8) & 0xFF;
}
inline uint8_t getA(uint32_t color)
{
    return color & 0xFF;
}

// Hue, saturation and value in [0.0, 1.0].
inline uint32_t hsv(float hue, float saturation, float value, float alpha = 1.0f)
{
    const float h = (hue - std::floor(hue)) * 6.0f;
    const int sector = static_cast<int>(h) % 6;
    const float f = h - std::floor(h);
    const float p = value * (1.0f - saturation);
    const float q = value * (1.0f - saturation * f);
    const float t = value * (1.0f - saturation * (1.0f - f));

    switch (sector) {
        case 0:
            return rgbaF(value, t, p, alpha);
        case 1:
            return rgbaF(q, value, p, alpha);
        case 2:
            return rgbaF(p, value, t, alpha);
        case 3:
            return rgbaF(p, q, value, alpha);
        case 4:
            return rgbaF(t, p, value, alpha);
        default:
            return rgbaF(value, p, q, alpha);
    }
}

} // namespace ColorNames
