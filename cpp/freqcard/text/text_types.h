#ifndef FREQCARD_TEXT_TEXT_TYPES_H
#define FREQCARD_TEXT_TEXT_TYPES_H

#include <cstdint>
#include <vector>

namespace freqcard::text {

// Font metrics in pixels at the font's size
struct FontMetrics {
    float unitsPerEM;
    float ascender;             // Positive, above baseline
    float descender;            // Negative, below baseline
    float lineGap;

    float lineHeight() const { return ascender - descender + lineGap; }
};

// Ink bounds of a run, relative to a pen origin on the ascender line (y down).
// x0 is the left-side bearing of the first glyph.
struct TextBounds {
    float x0 = 0.0f;
    float y0 = 0.0f;
    float x1 = 0.0f;
    float y1 = 0.0f;

    float width() const { return x1 - x0; }
    float height() const { return y1 - y0; }
};

// One glyph of a laid-out run
struct PositionedGlyph {
    std::uint32_t glyphId;      // Font-specific glyph index
    std::uint32_t codepoint;
    float x;                    // Pen x relative to run origin
    float yOffset;              // Vertical offset from baseline
    float xAdvance;
};

// 8-bit coverage bitmap of a single glyph
struct GlyphBitmap {
    int width = 0;
    int height = 0;
    int left = 0;               // Offset from pen x to the first column
    int top = 0;                // Offset from baseline up to the first row
    std::vector<std::uint8_t> coverage;
};

} // namespace freqcard::text

#endif // FREQCARD_TEXT_TEXT_TYPES_H
