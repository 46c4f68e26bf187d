#ifndef FREQCARD_LAYOUT_PILL_PACKER_H
#define FREQCARD_LAYOUT_PILL_PACKER_H

#include "freqcard/layout/layout_config.h"
#include "freqcard/layout/layout_types.h"
#include "freqcard/text/font.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace freqcard::layout {

enum class PackingPolicy : std::uint8_t {
    FixedSlot = 0,      // Exactly 5 labels in rows of [2, 2, 1]
    GreedyFlow = 1,     // Any number of labels, shuffled, flowed into maxLines rows
};

/**
 * PillPacker: places labeled pills into rows below a width budget.
 *
 * Fixed slot:
 *   Labels 0..4 go to rows [0,1], [2,3], [4]. Positions 1 and 2 get the
 *   accent background whatever their category. A pair that overflows the row
 *   shrinks its wider pill one ellipsis step at a time (the first one on a
 *   tie); once that pill is at the floor the other one shrinks instead. The
 *   lone pill of the last row shrinks the same way until it fits.
 *
 * Greedy flow:
 *   Input order is shuffled with the caller's generator. Each label is first
 *   shrunk until its pill alone fits rowMaxWidth, then appended to the current
 *   row if it fits there, otherwise it opens a new row. When maxLines rows are
 *   full, the remaining labels are dropped. Background follows the category.
 *
 * Rows are stacked from `origin` with a pitch of pillHeight + gapY.
 */
class PillPacker {
public:
    static constexpr std::size_t kFixedSlotCount = 5;
    static constexpr std::array<std::size_t, 3> kFixedRowSizes = {2, 2, 1};
    static constexpr std::uint32_t kDefaultShuffleSeed = 42;

    PillPacker(const text::Font& font, const LayoutConfig& config);

    /**
     * Pack with the given policy. `rng` is only consumed by GreedyFlow.
     * @throws ConfigurationError for FixedSlot with a label count other than 5
     */
    PackingResult pack(
        PackingPolicy policy,
        const std::vector<Label>& labels,
        Point origin,
        std::mt19937& rng
    ) const;

    /**
     * @throws ConfigurationError if labels.size() != 5
     */
    PackingResult packFixedSlot(const std::vector<Label>& labels, Point origin) const;

    PackingResult packGreedyFlow(
        const std::vector<Label>& labels,
        Point origin,
        std::mt19937& rng
    ) const;

    /**
     * Fisher-Yates shuffle driven only by raw generator output, so a given
     * seed yields the same order with every standard library.
     */
    static void shuffle(std::vector<std::size_t>& order, std::mt19937& rng);

private:
    const text::Font* font_;
    LayoutConfig config_;

    float pillWidth(const std::string& text) const;
    float rowY(std::size_t row, Point origin) const;

    PlacedLabel place(
        std::size_t sourceIndex,
        const Label& label,
        const std::string& displayText,
        BackgroundStyle style,
        Point topLeft
    ) const;
};

} // namespace freqcard::layout

#endif // FREQCARD_LAYOUT_PILL_PACKER_H
