#include "freqcard/render/renderer.h"
#include "freqcard/core/string_utils.h"

#include <cmath>

namespace freqcard::render {

Renderer::Renderer(Canvas& canvas)
    : canvas_(&canvas)
{
}

void Renderer::paintRun(
    const text::Font& font,
    std::string_view text,
    float originX,
    float baselineY,
    Color color
) {
    for (const text::PositionedGlyph& glyph : font.layoutRun(text)) {
        std::optional<text::GlyphBitmap> bitmap = font.rasterize(glyph);
        if (!bitmap) {
            continue;
        }
        const int penX = static_cast<int>(std::lround(originX + glyph.x));
        const int baseline = static_cast<int>(std::lround(baselineY - glyph.yOffset));
        canvas_->blendGlyph(*bitmap, penX, baseline, color);
    }
}

void Renderer::drawText(const text::Font& font, std::string_view text, Point origin, Color color) {
    if (text.empty()) {
        return;
    }
    paintRun(font, text, origin.x, origin.y + font.metrics().ascender, color);
    ++drawCalls_;
}

void Renderer::drawTrackedText(
    const text::Font& font,
    std::string_view text,
    Point origin,
    Color color,
    float tracking
) {
    if (text.empty()) {
        return;
    }
    const float baselineY = origin.y + font.metrics().ascender;
    float x = origin.x;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(text, pos, byteLen);
        if (byteLen == 0) {
            break;
        }
        paintRun(font, text.substr(pos, byteLen), x, baselineY, color);
        x += font.advanceWidth(cp) + tracking;
        pos += byteLen;
    }
    ++drawCalls_;
}

void Renderer::drawWrappedLines(
    const text::Font& font,
    const std::vector<text::WrappedLine>& lines,
    Color color,
    float tracking
) {
    for (const text::WrappedLine& line : lines) {
        if (tracking != 0.0f) {
            drawTrackedText(font, line.text, line.origin, color, tracking);
        } else {
            drawText(font, line.text, line.origin, color);
        }
        if (line.ellipsized) {
            drawText(font, text::LineWrapper::kEllipsis,
                     Point{line.origin.x + line.ellipsisX, line.origin.y}, color);
        }
    }
}

void Renderer::drawPill(
    const text::Font& font,
    const LayoutBox& box,
    std::string_view text,
    Point textOrigin,
    Color fill,
    Color textColor
) {
    canvas_->fillRoundedRect(box, box.height * 0.5f, fill);
    ++drawCalls_;
    drawText(font, text, textOrigin, textColor);
}

void Renderer::drawPacking(
    const text::Font& font,
    const layout::PackingResult& packing,
    const scene::ScenePalette& palette
) {
    for (const layout::PackedRow& row : packing.rows) {
        for (const layout::PlacedLabel& placed : row.labels) {
            drawPill(font, placed.box, placed.displayText, placed.textOrigin,
                     scene::pillColor(palette, placed.style), palette.pillText);
        }
    }
}

} // namespace freqcard::render
