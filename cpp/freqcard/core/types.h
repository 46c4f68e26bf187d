#ifndef FREQCARD_CORE_TYPES_H
#define FREQCARD_CORE_TYPES_H

#include <cstdint>

namespace freqcard {

// Axis-aligned box in canvas pixel space (origin top-left, y down).
struct LayoutBox {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    float right() const { return x + width; }
    float bottom() const { return y + height; }
};

struct Point {
    float x = 0.0f;
    float y = 0.0f;
};

// 8-bit straight-alpha RGBA
struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;
};

inline bool operator==(const Color& lhs, const Color& rhs) {
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b && lhs.a == rhs.a;
}

inline bool operator!=(const Color& lhs, const Color& rhs) {
    return !(lhs == rhs);
}

} // namespace freqcard

#endif // FREQCARD_CORE_TYPES_H
