#ifndef FREQCARD_LAYOUT_TRUNCATION_H
#define FREQCARD_LAYOUT_TRUNCATION_H

#include "freqcard/text/font.h"
#include <cstddef>
#include <string>
#include <string_view>

namespace freqcard::layout {

/**
 * One shrink step of a label.
 *
 * Texts at or below `floor` codepoints come back unchanged. Otherwise the last
 * codepoint is dropped and, if the rest is still longer than the floor, its
 * tail is replaced with the ellipsis. With the defaults this replaces the
 * trailing run of 4 codepoints by "...", so an ellipsized label loses one
 * real character per step.
 */
std::string ellipsisStep(std::string_view text, std::size_t floor = 3, std::string_view ellipsis = "...");

/**
 * Apply ellipsisStep until pillWidth(text) <= maxPillWidth or the floor is hit.
 * @param truncated Set to true when the text changed
 */
std::string truncateToPillWidth(
    std::string_view text,
    const text::Font& font,
    float paddingX,
    float maxPillWidth,
    std::size_t floor,
    std::string_view ellipsis,
    bool& truncated
);

} // namespace freqcard::layout

#endif // FREQCARD_LAYOUT_TRUNCATION_H
