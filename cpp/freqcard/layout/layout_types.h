#ifndef FREQCARD_LAYOUT_LAYOUT_TYPES_H
#define FREQCARD_LAYOUT_LAYOUT_TYPES_H

#include "freqcard/core/types.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace freqcard::layout {

enum class LabelCategory : std::uint8_t {
    Tag = 0,
    Verbatim = 1,
    Artist = 2,
    SceneName = 3,
};

// Pill background; the scene palette maps it to a color
enum class BackgroundStyle : std::uint8_t {
    Neutral = 0,
    Accent = 1,
};

BackgroundStyle styleForCategory(LabelCategory category);

const char* categoryName(LabelCategory category);

/**
 * Parse "tag", "verbatim", "artist" or "scene" (case-insensitive).
 * @return True and sets `out` on success
 */
bool parseCategory(const std::string& name, LabelCategory& out);

struct Label {
    LabelCategory category = LabelCategory::Tag;
    std::string text;
    BackgroundStyle backgroundStyle = BackgroundStyle::Neutral;

    // Label whose background follows its category
    static Label make(LabelCategory category, std::string text);
};

// A label with resolved geometry
struct PlacedLabel {
    std::size_t sourceIndex = 0;    // Position in the packer's input
    Label label;
    std::string displayText;        // Possibly ellipsized
    bool truncated = false;
    BackgroundStyle style = BackgroundStyle::Neutral;
    LayoutBox box;                  // Pill rectangle
    Point textOrigin;               // Pen origin on the ascender line
};

// Labels of one row, in draw order
struct PackedRow {
    std::vector<PlacedLabel> labels;
    float width = 0.0f;             // Sum of pill widths + (count - 1) * gapX
};

struct PackingResult {
    std::vector<PackedRow> rows;
    std::size_t droppedCount = 0;   // Labels that found no row

    std::size_t labelCount() const {
        std::size_t count = 0;
        for (const PackedRow& row : rows) {
            count += row.labels.size();
        }
        return count;
    }

    bool empty() const { return rows.empty(); }
};

} // namespace freqcard::layout

#endif // FREQCARD_LAYOUT_LAYOUT_TYPES_H
