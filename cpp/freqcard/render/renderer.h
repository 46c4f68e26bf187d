#ifndef FREQCARD_RENDER_RENDERER_H
#define FREQCARD_RENDER_RENDERER_H

#include "freqcard/render/canvas.h"
#include "freqcard/layout/layout_types.h"
#include "freqcard/scene/scene.h"
#include "freqcard/text/font.h"
#include "freqcard/text/line_wrapper.h"
#include <cstddef>
#include <string_view>
#include <vector>

namespace freqcard::render {

/**
 * Renderer: paints resolved layout onto a Canvas.
 *
 * Every position comes from the layout layer; nothing here measures text to
 * make a placement decision. Text origins are pen positions on the ascender
 * line, the baseline sits `ascender` pixels below.
 */
class Renderer {
public:
    explicit Renderer(Canvas& canvas);

    /**
     * Draw a run as laid out by the font (kerning, no tracking).
     */
    void drawText(const text::Font& font, std::string_view text, Point origin, Color color);

    /**
     * Draw codepoint by codepoint; the cursor advances by
     * advanceWidth(c) + tracking after every codepoint.
     */
    void drawTrackedText(
        const text::Font& font,
        std::string_view text,
        Point origin,
        Color color,
        float tracking
    );

    /**
     * Draw positioned wrapped lines. The ellipsis of a truncated line is drawn
     * untracked at its resolved offset.
     */
    void drawWrappedLines(
        const text::Font& font,
        const std::vector<text::WrappedLine>& lines,
        Color color,
        float tracking
    );

    /**
     * Rounded box (radius = height / 2) with text at the given origin.
     */
    void drawPill(
        const text::Font& font,
        const LayoutBox& box,
        std::string_view text,
        Point textOrigin,
        Color fill,
        Color textColor
    );

    void drawPacking(
        const text::Font& font,
        const layout::PackingResult& packing,
        const scene::ScenePalette& palette
    );

    // Number of text runs and pills painted so far
    std::size_t drawCalls() const { return drawCalls_; }

private:
    Canvas* canvas_;
    std::size_t drawCalls_ = 0;

    void paintRun(const text::Font& font, std::string_view text, float originX, float baselineY, Color color);
};

} // namespace freqcard::render

#endif // FREQCARD_RENDER_RENDERER_H
