#include "freqcard/render/canvas.h"
#include "freqcard/core/errors.h"

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_PNG
#include <stb_image.h>
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <algorithm>
#include <cmath>
#include <cstring>

namespace freqcard::render {

namespace {

constexpr int kChannels = 4;

void appendToVector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<std::uint8_t>*>(context);
    const auto* bytes = static_cast<const std::uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

// Signed distance from (px, py) to a rounded rectangle centered at (cx, cy)
float roundedRectDistance(float px, float py, float cx, float cy, float halfW, float halfH, float radius) {
    const float qx = std::fabs(px - cx) - (halfW - radius);
    const float qy = std::fabs(py - cy) - (halfH - radius);
    const float ox = std::max(qx, 0.0f);
    const float oy = std::max(qy, 0.0f);
    return std::sqrt(ox * ox + oy * oy) + std::min(std::max(qx, qy), 0.0f) - radius;
}

} // namespace

Canvas::Canvas(int width, int height, Color fill)
    : width_(std::max(0, width))
    , height_(std::max(0, height))
{
    pixels_.resize(static_cast<std::size_t>(width_) * height_ * kChannels);
    for (std::size_t i = 0; i < pixels_.size(); i += kChannels) {
        pixels_[i + 0] = fill.r;
        pixels_[i + 1] = fill.g;
        pixels_[i + 2] = fill.b;
        pixels_[i + 3] = fill.a;
    }
}

Canvas Canvas::loadPng(const std::string& path) {
    int w = 0;
    int h = 0;
    int channelsInFile = 0;
    stbi_uc* data = stbi_load(path.c_str(), &w, &h, &channelsInFile, kChannels);
    if (!data) {
        const char* reason = stbi_failure_reason();
        throw AssetError("Background image not found or unreadable: " + path +
                         (reason ? std::string(" (") + reason + ")" : std::string()));
    }

    Canvas canvas;
    canvas.width_ = w;
    canvas.height_ = h;
    canvas.pixels_.assign(data, data + static_cast<std::size_t>(w) * h * kChannels);
    stbi_image_free(data);
    return canvas;
}

void Canvas::savePng(const std::string& path) const {
    if (empty()) {
        throw AssetError("Cannot write empty image: " + path);
    }
    const int ok = stbi_write_png(path.c_str(), width_, height_, kChannels,
                                  pixels_.data(), width_ * kChannels);
    if (!ok) {
        throw AssetError("Failed to write image: " + path);
    }
}

std::vector<std::uint8_t> Canvas::encodePng() const {
    std::vector<std::uint8_t> out;
    if (empty()) {
        throw AssetError("Cannot encode empty image");
    }
    const int ok = stbi_write_png_to_func(appendToVector, &out, width_, height_, kChannels,
                                          pixels_.data(), width_ * kChannels);
    if (!ok) {
        throw AssetError("PNG encoding failed");
    }
    return out;
}

Color Canvas::pixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        return Color{0, 0, 0, 0};
    }
    const std::size_t i = (static_cast<std::size_t>(y) * width_ + x) * kChannels;
    return Color{pixels_[i], pixels_[i + 1], pixels_[i + 2], pixels_[i + 3]};
}

void Canvas::setPixel(int x, int y, Color color) {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        return;
    }
    const std::size_t i = (static_cast<std::size_t>(y) * width_ + x) * kChannels;
    pixels_[i + 0] = color.r;
    pixels_[i + 1] = color.g;
    pixels_[i + 2] = color.b;
    pixels_[i + 3] = color.a;
}

void Canvas::blendPixel(int x, int y, Color color, std::uint8_t coverage) {
    if (x < 0 || y < 0 || x >= width_ || y >= height_ || coverage == 0 || color.a == 0) {
        return;
    }
    const std::size_t i = (static_cast<std::size_t>(y) * width_ + x) * kChannels;

    const float sa = (color.a / 255.0f) * (coverage / 255.0f);
    const float da = pixels_[i + 3] / 255.0f;
    const float outA = sa + da * (1.0f - sa);
    if (outA <= 0.0f) {
        return;
    }

    auto mix = [&](std::uint8_t src, std::uint8_t dst) {
        const float v = (src * sa + dst * da * (1.0f - sa)) / outA;
        return static_cast<std::uint8_t>(std::clamp(std::lround(v), 0L, 255L));
    };
    pixels_[i + 0] = mix(color.r, pixels_[i + 0]);
    pixels_[i + 1] = mix(color.g, pixels_[i + 1]);
    pixels_[i + 2] = mix(color.b, pixels_[i + 2]);
    pixels_[i + 3] = static_cast<std::uint8_t>(std::clamp(std::lround(outA * 255.0f), 0L, 255L));
}

void Canvas::fillRoundedRect(const LayoutBox& box, float radius, Color color) {
    if (box.width <= 0.0f || box.height <= 0.0f) {
        return;
    }
    const float halfW = box.width * 0.5f;
    const float halfH = box.height * 0.5f;
    const float cx = box.x + halfW;
    const float cy = box.y + halfH;
    const float r = std::clamp(radius, 0.0f, std::min(halfW, halfH));

    const int x0 = std::max(0, static_cast<int>(std::floor(box.x)));
    const int y0 = std::max(0, static_cast<int>(std::floor(box.y)));
    const int x1 = std::min(width_, static_cast<int>(std::ceil(box.right())));
    const int y1 = std::min(height_, static_cast<int>(std::ceil(box.bottom())));

    for (int y = y0; y < y1; ++y) {
        for (int x = x0; x < x1; ++x) {
            const float d = roundedRectDistance(x + 0.5f, y + 0.5f, cx, cy, halfW, halfH, r);
            const float coverage = std::clamp(0.5f - d, 0.0f, 1.0f);
            if (coverage > 0.0f) {
                blendPixel(x, y, color, static_cast<std::uint8_t>(std::lround(coverage * 255.0f)));
            }
        }
    }
}

void Canvas::blendGlyph(const text::GlyphBitmap& glyph, int penX, int baselineY, Color color) {
    const int left = penX + glyph.left;
    const int top = baselineY - glyph.top;
    for (int gy = 0; gy < glyph.height; ++gy) {
        for (int gx = 0; gx < glyph.width; ++gx) {
            const std::uint8_t c = glyph.coverage[static_cast<std::size_t>(gy) * glyph.width + gx];
            if (c != 0) {
                blendPixel(left + gx, top + gy, color, c);
            }
        }
    }
}

} // namespace freqcard::render
