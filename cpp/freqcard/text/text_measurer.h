#ifndef FREQCARD_TEXT_TEXT_MEASURER_H
#define FREQCARD_TEXT_TEXT_MEASURER_H

#include "freqcard/text/font.h"
#include <string_view>

namespace freqcard::text {

/**
 * TextMeasurer: pixel widths of strings under a font, with optional tracking.
 *
 * Two quantities exist for tracked text and they differ by one tracking step:
 * - width(): layout width. Tracking counts only between characters.
 * - drawAdvance(): how far the drawing cursor moves. The tracked draw adds
 *   tracking after every character, the last one included.
 * Fitting and centering use width(); anything positioned right after tracked
 * text (the wrap ellipsis) uses drawAdvance().
 */
class TextMeasurer {
public:
    /**
     * Layout width of a string.
     * tracking == 0: the font's ink bounding-box width of the whole run.
     * tracking != 0: sum of advance widths + tracking * (count - 1).
     */
    static float width(std::string_view text, const Font& font, float tracking = 0.0f);

    /**
     * Cursor travel of a tracked draw: sum of (advance + tracking) per codepoint.
     */
    static float drawAdvance(std::string_view text, const Font& font, float tracking);

    /**
     * Sum of advance widths, no tracking.
     */
    static float advanceSum(std::string_view text, const Font& font);
};

} // namespace freqcard::text

#endif // FREQCARD_TEXT_TEXT_MEASURER_H
