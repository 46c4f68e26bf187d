#include "freqcard/layout/pill_packer.h"
#include "freqcard/layout/pill_sizer.h"
#include "freqcard/layout/truncation.h"
#include "freqcard/core/errors.h"
#include "freqcard/core/logging.h"
#include "freqcard/core/string_utils.h"

#include <numeric>
#include <string>
#include <utility>

namespace freqcard::layout {

PillPacker::PillPacker(const text::Font& font, const LayoutConfig& config)
    : font_(&font)
    , config_(config)
{
}

PackingResult PillPacker::pack(
    PackingPolicy policy,
    const std::vector<Label>& labels,
    Point origin,
    std::mt19937& rng
) const {
    if (policy == PackingPolicy::FixedSlot) {
        return packFixedSlot(labels, origin);
    }
    return packGreedyFlow(labels, origin, rng);
}

// =============================================================================
// Fixed Slot
// =============================================================================

PackingResult PillPacker::packFixedSlot(const std::vector<Label>& labels, Point origin) const {
    if (labels.size() != kFixedSlotCount) {
        throw ConfigurationError(
            "fixed-slot packing needs exactly " + std::to_string(kFixedSlotCount) +
            " labels, got " + std::to_string(labels.size()));
    }

    const std::size_t floor = config_.truncationFloor;
    const std::string& ellipsis = config_.ellipsis;

    PackingResult result;
    std::size_t next = 0;
    for (std::size_t rowIndex = 0; rowIndex < kFixedRowSizes.size(); ++rowIndex) {
        const std::size_t count = kFixedRowSizes[rowIndex];
        std::vector<std::string> display;
        for (std::size_t i = 0; i < count; ++i) {
            display.push_back(labels[next + i].text);
        }

        if (count == 2) {
            while (true) {
                const float w0 = pillWidth(display[0]);
                const float w1 = pillWidth(display[1]);
                if (w0 + config_.gapX + w1 <= config_.rowMaxWidth) {
                    break;
                }
                // Wider pill shrinks first; once it is at the floor the other one does
                const std::size_t wider = w0 >= w1 ? 0 : 1;
                const std::size_t other = 1 - wider;
                if (codepointCount(display[wider]) > floor) {
                    display[wider] = ellipsisStep(display[wider], floor, ellipsis);
                } else if (codepointCount(display[other]) > floor) {
                    display[other] = ellipsisStep(display[other], floor, ellipsis);
                } else {
                    break;
                }
            }
        } else {
            while (pillWidth(display[0]) > config_.rowMaxWidth &&
                   codepointCount(display[0]) > floor) {
                display[0] = ellipsisStep(display[0], floor, ellipsis);
            }
        }

        PackedRow row;
        float x = origin.x;
        const float y = rowY(rowIndex, origin);
        for (std::size_t i = 0; i < count; ++i) {
            const std::size_t sourceIndex = next + i;
            // Second and third pill are highlighted
            const BackgroundStyle style = (sourceIndex == 1 || sourceIndex == 2)
                ? BackgroundStyle::Accent
                : BackgroundStyle::Neutral;
            PlacedLabel placed = place(sourceIndex, labels[sourceIndex], display[i], style, Point{x, y});
            if (placed.truncated) {
                FREQCARD_LOG_DEBUG("label %zu truncated to '%s'", sourceIndex, placed.displayText.c_str());
            }
            row.width += (row.labels.empty() ? 0.0f : config_.gapX) + placed.box.width;
            x = placed.box.right() + config_.gapX;
            row.labels.push_back(std::move(placed));
        }
        result.rows.push_back(std::move(row));
        next += count;
    }

    return result;
}

// =============================================================================
// Greedy Flow
// =============================================================================

PackingResult PillPacker::packGreedyFlow(
    const std::vector<Label>& labels,
    Point origin,
    std::mt19937& rng
) const {
    PackingResult result;
    if (labels.empty()) {
        return result;
    }
    if (config_.maxLines == 0) {
        result.droppedCount = labels.size();
        return result;
    }

    std::vector<std::size_t> order(labels.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    shuffle(order, rng);

    PackedRow current;
    for (std::size_t k = 0; k < order.size(); ++k) {
        const std::size_t sourceIndex = order[k];
        const Label& label = labels[sourceIndex];

        bool truncated = false;
        const std::string display = truncateToPillWidth(
            label.text, *font_, config_.paddingX, config_.rowMaxWidth,
            config_.truncationFloor, config_.ellipsis, truncated);
        if (truncated) {
            FREQCARD_LOG_DEBUG("%s label %zu truncated to '%s'",
                               categoryName(label.category), sourceIndex, display.c_str());
        }
        const float width = pillWidth(display);
        if (width > config_.rowMaxWidth) {
            ++result.droppedCount;
            FREQCARD_LOG_DEBUG("%s label %zu does not fit a row at %zu codepoints, dropped",
                               categoryName(label.category), sourceIndex, config_.truncationFloor);
            continue;
        }

        if (!current.labels.empty() && current.width + config_.gapX + width > config_.rowMaxWidth) {
            result.rows.push_back(std::move(current));
            current = PackedRow{};
            if (result.rows.size() >= config_.maxLines) {
                result.droppedCount += order.size() - k;
                FREQCARD_LOG_DEBUG("row limit %zu reached, dropped %zu label(s)",
                                   config_.maxLines, result.droppedCount);
                return result;
            }
        }

        const float x = current.labels.empty()
            ? origin.x
            : current.labels.back().box.right() + config_.gapX;
        PlacedLabel placed = place(sourceIndex, label, display, label.backgroundStyle,
                                   Point{x, rowY(result.rows.size(), origin)});
        placed.truncated = truncated;
        current.width += (current.labels.empty() ? 0.0f : config_.gapX) + placed.box.width;
        current.labels.push_back(std::move(placed));
    }

    if (!current.labels.empty()) {
        result.rows.push_back(std::move(current));
    }
    return result;
}

void PillPacker::shuffle(std::vector<std::size_t>& order, std::mt19937& rng) {
    if (order.size() < 2) {
        return;
    }
    for (std::size_t i = order.size() - 1; i > 0; --i) {
        const std::size_t j = static_cast<std::size_t>(rng() % (i + 1));
        std::swap(order[i], order[j]);
    }
}

// =============================================================================
// Helpers
// =============================================================================

float PillPacker::pillWidth(const std::string& text) const {
    return PillSizer::pillWidth(text, *font_, config_.paddingX);
}

float PillPacker::rowY(std::size_t row, Point origin) const {
    return origin.y + static_cast<float>(row) * (config_.pillHeight + config_.gapY);
}

PlacedLabel PillPacker::place(
    std::size_t sourceIndex,
    const Label& label,
    const std::string& displayText,
    BackgroundStyle style,
    Point topLeft
) const {
    PlacedLabel placed;
    placed.sourceIndex = sourceIndex;
    placed.label = label;
    placed.displayText = displayText;
    placed.truncated = displayText != label.text;
    placed.style = style;
    placed.box = PillSizer::pillBox(displayText, *font_, config_.paddingX, config_.pillHeight, topLeft);
    placed.textOrigin = PillSizer::centerText(displayText, *font_, placed.box, config_.baselineCorrection);
    return placed;
}

} // namespace freqcard::layout
