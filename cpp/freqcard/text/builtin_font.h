#ifndef FREQCARD_TEXT_BUILTIN_FONT_H
#define FREQCARD_TEXT_BUILTIN_FONT_H

#include "freqcard/text/font.h"

namespace freqcard::text {

/**
 * BuiltinFont: fixed-metrics monospace font that needs no font file.
 *
 * Substituted when a font asset cannot be loaded so that layout proceeds
 * unaffected. Every codepoint advances by 0.6 * size; ink covers the full
 * cell. Glyphs rasterize as outlined boxes.
 */
class BuiltinFont : public Font {
public:
    explicit BuiltinFont(float size);

    float size() const override { return size_; }
    FontMetrics metrics() const override;
    float advanceWidth(std::uint32_t codepoint) const override;
    TextBounds bounds(std::string_view text) const override;
    std::vector<PositionedGlyph> layoutRun(std::string_view text) const override;
    std::optional<GlyphBitmap> rasterize(const PositionedGlyph& glyph) const override;
    bool isFallback() const override { return true; }

    static constexpr float kAdvanceRatio = 0.6f;
    static constexpr float kAscenderRatio = 0.8f;
    static constexpr float kDescenderRatio = -0.2f;
    static constexpr float kLineGapRatio = 0.1f;

private:
    float size_;
};

} // namespace freqcard::text

#endif // FREQCARD_TEXT_BUILTIN_FONT_H
