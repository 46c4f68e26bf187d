#ifndef FREQCARD_RENDER_CANVAS_H
#define FREQCARD_RENDER_CANVAS_H

#include "freqcard/core/types.h"
#include "freqcard/text/text_types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace freqcard::render {

/**
 * Canvas: RGBA8 pixel buffer (straight alpha, row-major, no padding).
 *
 * All drawing blends source-over. Coordinates outside the canvas are clipped.
 */
class Canvas {
public:
    Canvas() = default;
    Canvas(int width, int height, Color fill = Color{0, 0, 0, 0});

    /**
     * Decode a PNG file.
     * @throws AssetError if the file is missing or cannot be decoded
     */
    static Canvas loadPng(const std::string& path);

    /**
     * @throws AssetError if the file cannot be written
     */
    void savePng(const std::string& path) const;

    /**
     * Encode to an in-memory PNG.
     * @throws AssetError if encoding fails
     */
    std::vector<std::uint8_t> encodePng() const;

    int width() const { return width_; }
    int height() const { return height_; }
    bool empty() const { return width_ <= 0 || height_ <= 0; }

    const std::vector<std::uint8_t>& pixels() const { return pixels_; }

    Color pixel(int x, int y) const;
    void setPixel(int x, int y, Color color);

    /**
     * Blend `color` into one pixel, its alpha scaled by coverage/255.
     */
    void blendPixel(int x, int y, Color color, std::uint8_t coverage = 255);

    /**
     * Anti-aliased rounded rectangle. radius is clamped to half the shorter side.
     */
    void fillRoundedRect(const LayoutBox& box, float radius, Color color);

    /**
     * Blend a glyph coverage bitmap whose pen position is (penX, baselineY).
     */
    void blendGlyph(const text::GlyphBitmap& glyph, int penX, int baselineY, Color color);

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<std::uint8_t> pixels_;
};

} // namespace freqcard::render

#endif // FREQCARD_RENDER_CANVAS_H
