#include "freqcard/text/font_manager.h"
#include "freqcard/core/logging.h"
#include "freqcard/core/string_utils.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H

#include <hb.h>
#include <hb-ft.h>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <limits>

namespace freqcard::text {

namespace {

// Scale factor for HarfBuzz positions (26.6 fixed point to float)
constexpr float kHbScale = 1.0f / 64.0f;

std::string cacheKey(const std::string& path, float pixelSize) {
    return path + "@" + std::to_string(pixelSize);
}

} // namespace

// =============================================================================
// FreeTypeFont
// =============================================================================

FreeTypeFont::~FreeTypeFont() {
    if (hbFont_) {
        hb_font_destroy(hbFont_);
        hbFont_ = nullptr;
    }
    if (ftFace_) {
        FT_Done_Face(ftFace_);
        ftFace_ = nullptr;
    }
}

std::unique_ptr<FreeTypeFont> FreeTypeFont::create(
    FT_Library library,
    std::vector<std::uint8_t>&& fontData,
    float pixelSize
) {
    if (!library || fontData.empty() || pixelSize <= 0.0f) {
        return nullptr;
    }

    std::unique_ptr<FreeTypeFont> font(new FreeTypeFont());
    font->fontData_ = std::move(fontData);
    font->size_ = pixelSize;

    FT_Error error = FT_New_Memory_Face(
        library,
        font->fontData_.data(),
        static_cast<FT_Long>(font->fontData_.size()),
        0,  // face index
        &font->ftFace_
    );
    if (error || !font->ftFace_) {
        font->ftFace_ = nullptr;
        return nullptr;
    }

    // Set char size (fontSize in 26.6 fixed point, 72 DPI)
    error = FT_Set_Char_Size(
        font->ftFace_,
        0,
        static_cast<FT_F26Dot6>(pixelSize * 64),
        72,
        72
    );
    if (error) {
        return nullptr;
    }

    font->hbFont_ = hb_ft_font_create(font->ftFace_, nullptr);
    if (!font->hbFont_) {
        return nullptr;
    }
    hb_font_set_scale(
        font->hbFont_,
        static_cast<int>(pixelSize * 64),
        static_cast<int>(pixelSize * 64)
    );

    font->metrics_ = font->extractMetrics();
    return font;
}

FontMetrics FreeTypeFont::extractMetrics() const {
    FontMetrics metrics{};
    metrics.unitsPerEM = static_cast<float>(ftFace_->units_per_EM);
    if (metrics.unitsPerEM <= 0.0f) {
        metrics.unitsPerEM = 1000.0f;
    }
    float ascender = static_cast<float>(ftFace_->ascender);
    float descender = static_cast<float>(ftFace_->descender);
    float lineGap = static_cast<float>(ftFace_->height - ftFace_->ascender + ftFace_->descender);

    // sTypoAscender/Descender are generally more reliable
    TT_OS2* os2 = static_cast<TT_OS2*>(FT_Get_Sfnt_Table(ftFace_, FT_SFNT_OS2));
    if (os2 && (os2->sTypoAscender != 0 || os2->sTypoDescender != 0)) {
        ascender = static_cast<float>(os2->sTypoAscender);
        descender = static_cast<float>(os2->sTypoDescender);
        lineGap = static_cast<float>(os2->sTypoLineGap);
    }

    const float scale = size_ / metrics.unitsPerEM;
    metrics.ascender = ascender * scale;
    metrics.descender = descender * scale;
    metrics.lineGap = lineGap * scale;
    return metrics;
}

float FreeTypeFont::advanceWidth(std::uint32_t codepoint) const {
    hb_codepoint_t glyph = 0;
    if (!hb_font_get_nominal_glyph(hbFont_, codepoint, &glyph)) {
        glyph = 0;  // .notdef
    }
    return static_cast<float>(hb_font_get_glyph_h_advance(hbFont_, glyph)) * kHbScale;
}

std::vector<PositionedGlyph> FreeTypeFont::layoutRun(std::string_view text) const {
    std::vector<PositionedGlyph> out;
    if (text.empty()) {
        return out;
    }

    hb_buffer_t* buffer = hb_buffer_create();
    hb_buffer_add_utf8(buffer, text.data(), static_cast<int>(text.size()), 0, -1);
    hb_buffer_set_direction(buffer, HB_DIRECTION_LTR);
    hb_buffer_guess_segment_properties(buffer);

    // Measured widths must agree with per-character drawing
    hb_feature_t features[2];
    hb_feature_from_string("-liga", -1, &features[0]);
    hb_feature_from_string("-clig", -1, &features[1]);

    hb_shape(hbFont_, buffer, features, 2);

    unsigned int glyphCount = 0;
    hb_glyph_info_t* glyphInfo = hb_buffer_get_glyph_infos(buffer, &glyphCount);
    hb_glyph_position_t* glyphPos = hb_buffer_get_glyph_positions(buffer, &glyphCount);

    if (glyphInfo && glyphPos) {
        out.reserve(glyphCount);
        float penX = 0.0f;
        for (unsigned int i = 0; i < glyphCount; ++i) {
            std::uint32_t byteLen = 0;
            PositionedGlyph glyph{};
            glyph.glyphId = glyphInfo[i].codepoint;
            glyph.codepoint = decodeUtf8Codepoint(text, glyphInfo[i].cluster, byteLen);
            glyph.x = penX + glyphPos[i].x_offset * kHbScale;
            glyph.yOffset = glyphPos[i].y_offset * kHbScale;
            glyph.xAdvance = glyphPos[i].x_advance * kHbScale;
            penX += glyph.xAdvance;
            out.push_back(glyph);
        }
    }

    hb_buffer_destroy(buffer);
    return out;
}

TextBounds FreeTypeFont::bounds(std::string_view text) const {
    TextBounds result{};
    const std::vector<PositionedGlyph> glyphs = layoutRun(text);
    if (glyphs.empty()) {
        return result;
    }

    float minX = std::numeric_limits<float>::max();
    float maxX = std::numeric_limits<float>::lowest();
    float minY = std::numeric_limits<float>::max();
    float maxY = std::numeric_limits<float>::lowest();
    bool anyInk = false;

    for (const PositionedGlyph& glyph : glyphs) {
        hb_glyph_extents_t extents{};
        if (!hb_font_get_glyph_extents(hbFont_, glyph.glyphId, &extents)) {
            continue;
        }
        if (extents.width == 0 || extents.height == 0) {
            continue;  // whitespace
        }
        const float left = glyph.x + extents.x_bearing * kHbScale;
        const float right = left + extents.width * kHbScale;
        // HarfBuzz is y-up from the baseline; convert to y-down from the ascender line
        const float top = metrics_.ascender - (extents.y_bearing * kHbScale + glyph.yOffset);
        const float bottom = top - extents.height * kHbScale;
        minX = std::min(minX, left);
        maxX = std::max(maxX, right);
        minY = std::min(minY, top);
        maxY = std::max(maxY, bottom);
        anyInk = true;
    }

    if (!anyInk) {
        const PositionedGlyph& last = glyphs.back();
        result.x1 = last.x + last.xAdvance;
        return result;
    }

    result.x0 = minX;
    result.y0 = minY;
    result.x1 = maxX;
    result.y1 = maxY;
    return result;
}

std::optional<GlyphBitmap> FreeTypeFont::rasterize(const PositionedGlyph& glyph) const {
    FT_Error error = FT_Load_Glyph(ftFace_, glyph.glyphId, FT_LOAD_RENDER);
    if (error) {
        return std::nullopt;
    }

    const FT_GlyphSlot slot = ftFace_->glyph;
    const FT_Bitmap& bitmap = slot->bitmap;
    if (bitmap.width == 0 || bitmap.rows == 0 || !bitmap.buffer) {
        return std::nullopt;
    }

    GlyphBitmap bmp;
    bmp.width = static_cast<int>(bitmap.width);
    bmp.height = static_cast<int>(bitmap.rows);
    bmp.left = slot->bitmap_left;
    bmp.top = slot->bitmap_top;
    bmp.coverage.assign(static_cast<std::size_t>(bmp.width) * bmp.height, 0);

    for (int y = 0; y < bmp.height; ++y) {
        const unsigned char* row = bitmap.buffer + static_cast<std::ptrdiff_t>(y) * bitmap.pitch;
        std::uint8_t* dst = bmp.coverage.data() + static_cast<std::size_t>(y) * bmp.width;
        if (bitmap.pixel_mode == FT_PIXEL_MODE_MONO) {
            for (int x = 0; x < bmp.width; ++x) {
                dst[x] = (row[x >> 3] & (0x80 >> (x & 7))) ? 255 : 0;
            }
        } else {
            std::memcpy(dst, row, static_cast<std::size_t>(bmp.width));
        }
    }
    return bmp;
}

// =============================================================================
// FontManager
// =============================================================================

FontManager::FontManager() = default;

FontManager::~FontManager() {
    shutdown();
}

bool FontManager::initialize() {
    if (initialized_) {
        return true;
    }

    FT_Error error = FT_Init_FreeType(&ftLibrary_);
    if (error) {
        FREQCARD_LOG_WARN("FreeType initialization failed (error %d)", static_cast<int>(error));
        return false;
    }

    initialized_ = true;
    return true;
}

void FontManager::shutdown() {
    // Faces must go before the library
    fonts_.clear();
    pathCache_.clear();

    if (ftLibrary_) {
        FT_Done_FreeType(ftLibrary_);
        ftLibrary_ = nullptr;
    }

    initialized_ = false;
}

std::uint32_t FontManager::loadFontFromMemory(
    const std::uint8_t* fontData,
    std::size_t dataSize,
    float pixelSize
) {
    if (!initialized_ || !fontData || dataSize == 0) {
        return 0;
    }

    std::vector<std::uint8_t> dataCopy(fontData, fontData + dataSize);
    auto font = FreeTypeFont::create(ftLibrary_, std::move(dataCopy), pixelSize);
    if (!font) {
        return 0;
    }

    std::uint32_t fontId = nextFontId_++;
    fonts_[fontId] = std::move(font);
    return fontId;
}

std::uint32_t FontManager::loadFontFromFile(const std::string& filePath, float pixelSize) {
    if (!initialized_) {
        return 0;
    }

    std::ifstream file(filePath, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return 0;
    }

    std::streamsize size = file.tellg();
    if (size <= 0) {
        return 0;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return 0;
    }

    return loadFontFromMemory(buffer.data(), buffer.size(), pixelSize);
}

const Font& FontManager::loadFontOrFallback(const std::string& filePath, float pixelSize) {
    const std::string key = cacheKey(filePath, pixelSize);
    auto cached = pathCache_.find(key);
    if (cached == pathCache_.end()) {
        std::uint32_t fontId = loadFontFromFile(filePath, pixelSize);
        if (fontId == 0) {
            FREQCARD_LOG_WARN("could not load font '%s' at %.1fpx, using builtin font",
                              filePath.c_str(), static_cast<double>(pixelSize));
        }
        cached = pathCache_.emplace(key, fontId).first;
    }

    if (cached->second != 0) {
        if (const FreeTypeFont* font = getFont(cached->second)) {
            return *font;
        }
    }
    return fallbackFont(pixelSize);
}

const FreeTypeFont* FontManager::getFont(std::uint32_t fontId) const {
    auto it = fonts_.find(fontId);
    return (it != fonts_.end()) ? it->second.get() : nullptr;
}

const BuiltinFont& FontManager::fallbackFont(float pixelSize) {
    for (const auto& font : fallbacks_) {
        if (font->size() == pixelSize) {
            return *font;
        }
    }
    fallbacks_.push_back(std::make_unique<BuiltinFont>(pixelSize));
    return *fallbacks_.back();
}

} // namespace freqcard::text
