#include "freqcard/layout/pill_sizer.h"
#include "freqcard/text/text_measurer.h"

#include <cmath>

namespace freqcard::layout {

float PillSizer::pillWidth(std::string_view text, const text::Font& font, float paddingX) {
    return text::TextMeasurer::width(text, font) + 2.0f * paddingX;
}

LayoutBox PillSizer::pillBox(
    std::string_view text,
    const text::Font& font,
    float paddingX,
    float pillHeight,
    Point topLeft
) {
    LayoutBox box;
    box.x = topLeft.x;
    box.y = topLeft.y;
    box.width = pillWidth(text, font, paddingX);
    box.height = pillHeight;
    return box;
}

LayoutBox PillSizer::inkFitBox(
    std::string_view text,
    const text::Font& font,
    float paddingX,
    float paddingY,
    Point topLeft
) {
    const text::TextBounds ink = font.bounds(text);
    LayoutBox box;
    box.x = topLeft.x;
    box.y = topLeft.y;
    box.width = ink.width() + 2.0f * paddingX;
    box.height = ink.height() + 2.0f * paddingY;
    return box;
}

Point PillSizer::centerText(
    std::string_view text,
    const text::Font& font,
    const LayoutBox& pill,
    float baselineCorrection
) {
    const text::TextBounds ink = font.bounds(text);
    const text::FontMetrics m = font.metrics();
    const float bandHeight = m.ascender - m.descender;

    Point origin;
    origin.x = pill.x + (pill.width - ink.width()) * 0.5f - ink.x0;
    origin.y = pill.y + (pill.height - bandHeight) * 0.5f + baselineCorrection;
    return origin;
}

Point PillSizer::centerInk(std::string_view text, const text::Font& font, const LayoutBox& pill) {
    const text::TextBounds ink = font.bounds(text);
    Point origin;
    origin.x = pill.x + std::floor((pill.width - ink.width()) * 0.5f) - ink.x0;
    origin.y = pill.y + std::floor((pill.height - ink.height()) * 0.5f) - ink.y0;
    return origin;
}

} // namespace freqcard::layout
