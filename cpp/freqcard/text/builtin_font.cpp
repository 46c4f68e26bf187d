#include "freqcard/text/builtin_font.h"
#include "freqcard/core/string_utils.h"

#include <algorithm>
#include <cmath>

namespace freqcard::text {

BuiltinFont::BuiltinFont(float size)
    : size_(size > 0.0f ? size : 1.0f)
{
}

FontMetrics BuiltinFont::metrics() const {
    FontMetrics m{};
    m.unitsPerEM = 1000.0f;
    m.ascender = size_ * kAscenderRatio;
    m.descender = size_ * kDescenderRatio;
    m.lineGap = size_ * kLineGapRatio;
    return m;
}

float BuiltinFont::advanceWidth(std::uint32_t /*codepoint*/) const {
    return size_ * kAdvanceRatio;
}

TextBounds BuiltinFont::bounds(std::string_view text) const {
    TextBounds b{};
    const std::size_t count = codepointCount(text);
    if (count == 0) {
        return b;
    }
    b.x1 = static_cast<float>(count) * advanceWidth(0);
    b.y1 = size_ * (kAscenderRatio - kDescenderRatio);
    return b;
}

std::vector<PositionedGlyph> BuiltinFont::layoutRun(std::string_view text) const {
    std::vector<PositionedGlyph> glyphs;
    float x = 0.0f;
    for (std::uint32_t cp : decodeUtf8(text)) {
        PositionedGlyph g{};
        g.glyphId = cp;
        g.codepoint = cp;
        g.x = x;
        g.yOffset = 0.0f;
        g.xAdvance = advanceWidth(cp);
        glyphs.push_back(g);
        x += g.xAdvance;
    }
    return glyphs;
}

std::optional<GlyphBitmap> BuiltinFont::rasterize(const PositionedGlyph& glyph) const {
    if (glyph.codepoint < 0x80 && isAsciiSpace(static_cast<char>(glyph.codepoint))) {
        return std::nullopt;
    }

    const float advance = advanceWidth(glyph.codepoint);
    GlyphBitmap bmp;
    bmp.width = std::max(1, static_cast<int>(std::lround(advance * 0.8f)));
    bmp.height = std::max(1, static_cast<int>(std::lround(size_ * kAscenderRatio * 0.9f)));
    bmp.left = static_cast<int>(std::lround(advance * 0.1f));
    bmp.top = bmp.height;
    bmp.coverage.assign(static_cast<std::size_t>(bmp.width) * bmp.height, 0);

    const int stroke = std::max(1, static_cast<int>(size_ / 16.0f));
    for (int y = 0; y < bmp.height; ++y) {
        for (int x = 0; x < bmp.width; ++x) {
            const bool edge = x < stroke || y < stroke ||
                              x >= bmp.width - stroke || y >= bmp.height - stroke;
            if (edge) {
                bmp.coverage[static_cast<std::size_t>(y) * bmp.width + x] = 255;
            }
        }
    }
    return bmp;
}

} // namespace freqcard::text
