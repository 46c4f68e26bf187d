#ifndef FREQCARD_TEXT_LINE_WRAPPER_H
#define FREQCARD_TEXT_LINE_WRAPPER_H

#include "freqcard/core/types.h"
#include "freqcard/text/font.h"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace freqcard::text {

// A wrapped line of words
struct WrappedLine {
    std::string text;           // Words joined by single spaces, ellipsis excluded
    std::size_t wordCount = 0;
    float width = 0.0f;         // TextMeasurer::width(text, font, tracking)
    bool ellipsized = false;
    float ellipsisX = 0.0f;     // Ellipsis start, relative to the line origin
    Point origin;               // Filled by LineWrapper::positionLines
};

/**
 * LineWrapper: greedy word wrap against a pixel budget.
 *
 * Text is split on whitespace. Words are added to the current line while the
 * candidate line measures <= maxWidth. A single word wider than maxWidth gets
 * a line of its own; words are never broken.
 *
 * With maxLines set, lines past the limit are discarded and the last kept line
 * ends in an ellipsis. Its trailing words are dropped one at a time until
 * drawAdvance(line) + width(ellipsis) <= maxWidth, keeping at least one word.
 * The ellipsis is drawn untracked, starting right after the tracked line.
 */
class LineWrapper {
public:
    static constexpr const char* kEllipsis = "...";

    /**
     * @param text UTF-8 text, any whitespace separates words
     * @param font Font used for measurement
     * @param maxWidth Line budget in pixels
     * @param maxLines Optional cap on line count
     * @param tracking Extra spacing between characters while drawing
     * @return Lines in draw order; empty for empty input
     */
    static std::vector<WrappedLine> wrap(
        std::string_view text,
        const Font& font,
        float maxWidth,
        std::optional<std::size_t> maxLines = std::nullopt,
        float tracking = 0.0f
    );

    /**
     * Resolve line origins: line i is placed at origin.y + i * lineStep.
     */
    static void positionLines(std::vector<WrappedLine>& lines, Point origin, float lineStep);

    /**
     * Vertical distance between consecutive wrapped lines.
     */
    static float lineStep(const Font& font, float lineSpacing) { return font.size() + lineSpacing; }

private:
    static void ellipsizeLastLine(
        WrappedLine& line,
        const Font& font,
        float maxWidth,
        float tracking
    );
};

} // namespace freqcard::text

#endif // FREQCARD_TEXT_LINE_WRAPPER_H
