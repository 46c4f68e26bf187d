#include "freqcard/layout/truncation.h"
#include "freqcard/layout/pill_sizer.h"
#include "freqcard/core/string_utils.h"

namespace freqcard::layout {

std::string ellipsisStep(std::string_view text, std::size_t floor, std::string_view ellipsis) {
    if (codepointCount(text) <= floor) {
        return std::string(text);
    }

    std::string shorter = dropLastCodepoints(text, 1);
    if (codepointCount(shorter) > floor) {
        shorter = dropLastCodepoints(shorter, codepointCount(ellipsis));
        shorter.append(ellipsis.data(), ellipsis.size());
    }
    return shorter;
}

std::string truncateToPillWidth(
    std::string_view text,
    const text::Font& font,
    float paddingX,
    float maxPillWidth,
    std::size_t floor,
    std::string_view ellipsis,
    bool& truncated
) {
    std::string display(text);
    truncated = false;
    while (PillSizer::pillWidth(display, font, paddingX) > maxPillWidth &&
           codepointCount(display) > floor) {
        display = ellipsisStep(display, floor, ellipsis);
        truncated = true;
    }
    return display;
}

} // namespace freqcard::layout
