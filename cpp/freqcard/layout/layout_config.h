#ifndef FREQCARD_LAYOUT_LAYOUT_CONFIG_H
#define FREQCARD_LAYOUT_LAYOUT_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace freqcard::layout {

// Text elements of a scene card
enum class TextElement : std::uint8_t {
    Frequency,
    Genre,
    SceneName,
    Date,
    RadioName,
    Tag,
};

/**
 * LayoutConfig: every tunable of the pill and text layout.
 *
 * One engine serves all card variants; variants differ only in these values
 * (and in the palette/output mode chosen by the caller).
 */
struct LayoutConfig {
    float paddingX = 30.0f;         // Horizontal text padding inside a pill
    float paddingY = 15.0f;         // Vertical text padding inside a pill
    float pillHeight = 72.0f;       // Fixed pill height for tag rows
    float gapX = 24.0f;             // Between pills of a row
    float gapY = 24.0f;             // Between rows
    float rowMaxWidth = 948.0f;     // Row budget in pixels
    std::size_t maxLines = 3;       // Row cap for greedy flow
    std::map<TextElement, float> trackingByElement;

    std::string ellipsis = "...";
    std::size_t truncationFloor = 3;    // Codepoints; labels never shrink below this
    float baselineCorrection = -2.0f;   // Added to the metric-centered text top in pills

    float trackingFor(TextElement element) const;

    /**
     * Poster defaults for a canvas of the given width.
     * rowMaxWidth leaves a 66px margin on both sides; pill height follows the
     * tag font size.
     */
    static LayoutConfig forCanvas(float canvasWidth, float tagFontSize = 42.0f);

    static constexpr float kMargin = 66.0f;
};

} // namespace freqcard::layout

#endif // FREQCARD_LAYOUT_LAYOUT_CONFIG_H
