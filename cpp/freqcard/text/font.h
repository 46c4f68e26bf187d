#ifndef FREQCARD_TEXT_FONT_H
#define FREQCARD_TEXT_FONT_H

#include "freqcard/text/text_types.h"
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace freqcard::text {

/**
 * Font: glyph metrics provider at a fixed pixel size.
 *
 * Layout code only consumes this interface. Implementations are immutable
 * once constructed.
 */
class Font {
public:
    virtual ~Font() = default;

    /**
     * Pixel size the font was loaded at.
     */
    virtual float size() const = 0;

    virtual FontMetrics metrics() const = 0;

    /**
     * Horizontal advance of a single codepoint, in pixels.
     */
    virtual float advanceWidth(std::uint32_t codepoint) const = 0;

    /**
     * Ink bounds of the whole string laid out as one run.
     * @param text UTF-8 text
     */
    virtual TextBounds bounds(std::string_view text) const = 0;

    /**
     * Lay out a run of text left to right, without tracking.
     * @param text UTF-8 text
     * @return Glyphs with pen positions relative to the run origin
     */
    virtual std::vector<PositionedGlyph> layoutRun(std::string_view text) const = 0;

    /**
     * Rasterize a glyph produced by layoutRun().
     * @return Coverage bitmap, or std::nullopt for blank glyphs
     */
    virtual std::optional<GlyphBitmap> rasterize(const PositionedGlyph& glyph) const = 0;

    /**
     * True for the builtin substitute used when a font file cannot be loaded.
     */
    virtual bool isFallback() const { return false; }
};

} // namespace freqcard::text

#endif // FREQCARD_TEXT_FONT_H
