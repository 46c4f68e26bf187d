#ifndef FREQCARD_LAYOUT_PILL_SIZER_H
#define FREQCARD_LAYOUT_PILL_SIZER_H

#include "freqcard/core/types.h"
#include "freqcard/text/font.h"
#include <string_view>

namespace freqcard::layout {

/**
 * PillSizer: pill geometry and text placement inside a pill.
 *
 * Pill width is the measured text width plus horizontal padding on both
 * sides. Text is centered on its ink box, so a glyph's left-side bearing does
 * not push it off-center.
 */
class PillSizer {
public:
    static float pillWidth(std::string_view text, const text::Font& font, float paddingX);

    /**
     * Fixed-height pill at `topLeft`.
     */
    static LayoutBox pillBox(
        std::string_view text,
        const text::Font& font,
        float paddingX,
        float pillHeight,
        Point topLeft = {}
    );

    /**
     * Pill whose height hugs the ink box: inkHeight + 2 * paddingY.
     */
    static LayoutBox inkFitBox(
        std::string_view text,
        const text::Font& font,
        float paddingX,
        float paddingY,
        Point topLeft = {}
    );

    /**
     * Pen origin (ascender line) that centers `text` in `pill`.
     * Horizontal: ink box centered, left bearing compensated.
     * Vertical: ascender..descender band centered, then shifted by
     * `baselineCorrection`.
     */
    static Point centerText(
        std::string_view text,
        const text::Font& font,
        const LayoutBox& pill,
        float baselineCorrection
    );

    /**
     * Pen origin that centers the ink box of `text` in `pill` on both axes.
     * Offsets are floored to whole pixels.
     */
    static Point centerInk(std::string_view text, const text::Font& font, const LayoutBox& pill);
};

} // namespace freqcard::layout

#endif // FREQCARD_LAYOUT_PILL_SIZER_H
