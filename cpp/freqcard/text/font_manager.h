#ifndef FREQCARD_TEXT_FONT_MANAGER_H
#define FREQCARD_TEXT_FONT_MANAGER_H

#include "freqcard/text/font.h"
#include "freqcard/text/builtin_font.h"
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// Forward declarations for FreeType/HarfBuzz
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;

namespace freqcard::text {

/**
 * FreeTypeFont: a FreeType face and HarfBuzz font bound to one pixel size.
 *
 * Owns its face, its HarfBuzz font and the font bytes the face reads from.
 */
class FreeTypeFont : public Font {
public:
    ~FreeTypeFont() override;

    FreeTypeFont(const FreeTypeFont&) = delete;
    FreeTypeFont& operator=(const FreeTypeFont&) = delete;

    /**
     * Create a font from raw TTF/OTF data.
     * @param library Initialized FreeType library
     * @param fontData Font bytes (moved into the font)
     * @param pixelSize Size in pixels (72 DPI, 1pt = 1px)
     * @return Font, or nullptr if FreeType/HarfBuzz rejected the data
     */
    static std::unique_ptr<FreeTypeFont> create(
        FT_Library library,
        std::vector<std::uint8_t>&& fontData,
        float pixelSize
    );

    float size() const override { return size_; }
    FontMetrics metrics() const override { return metrics_; }
    float advanceWidth(std::uint32_t codepoint) const override;
    TextBounds bounds(std::string_view text) const override;
    std::vector<PositionedGlyph> layoutRun(std::string_view text) const override;
    std::optional<GlyphBitmap> rasterize(const PositionedGlyph& glyph) const override;

private:
    FreeTypeFont() = default;

    // Extract metrics from FT_Face, scaled to size_
    FontMetrics extractMetrics() const;

    float size_ = 0.0f;
    FT_Face ftFace_ = nullptr;
    hb_font_t* hbFont_ = nullptr;
    FontMetrics metrics_{};

    // Font data storage (kept alive while face is loaded)
    std::vector<std::uint8_t> fontData_;
};

/**
 * FontManager: Manages font loading and caching on top of FreeType/HarfBuzz.
 *
 * Responsibilities:
 * - Initialize/cleanup FreeType library
 * - Load fonts from memory or file at a given pixel size
 * - Cache loaded fonts by ID and by (path, size)
 * - Substitute the builtin font when a file cannot be loaded
 *
 * Fonts stay alive until shutdown(), so references handed out remain valid
 * for the manager's lifetime.
 */
class FontManager {
public:
    FontManager();
    ~FontManager();

    // Non-copyable
    FontManager(const FontManager&) = delete;
    FontManager& operator=(const FontManager&) = delete;

    /**
     * Initialize the font system. Must be called before loading fonts.
     * @return True if initialization succeeded
     */
    bool initialize();

    /**
     * Shutdown and cleanup all resources. Fonts handed out become invalid.
     */
    void shutdown();

    bool isInitialized() const { return initialized_; }

    // =========================================================================
    // Font Loading
    // =========================================================================

    /**
     * Load a font from memory.
     * @param fontData Raw TTF/OTF data (copied)
     * @param dataSize Size of font data in bytes
     * @param pixelSize Size in pixels
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromMemory(
        const std::uint8_t* fontData,
        std::size_t dataSize,
        float pixelSize
    );

    /**
     * Load a font from a file path.
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromFile(const std::string& filePath, float pixelSize);

    /**
     * Load a font file, or hand back the builtin font when that fails.
     * Repeated calls with the same path and size return the same font.
     */
    const Font& loadFontOrFallback(const std::string& filePath, float pixelSize);

    // =========================================================================
    // Font Access
    // =========================================================================

    /**
     * Get a font by ID.
     * @return Font, or nullptr if not found
     */
    const FreeTypeFont* getFont(std::uint32_t fontId) const;

    /**
     * Builtin font at the given size (owned by the manager).
     */
    const BuiltinFont& fallbackFont(float pixelSize);

private:
    bool initialized_ = false;
    FT_Library ftLibrary_ = nullptr;

    std::unordered_map<std::uint32_t, std::unique_ptr<FreeTypeFont>> fonts_;
    // "path@size" -> font ID (0 = load failed, use fallback)
    std::unordered_map<std::string, std::uint32_t> pathCache_;
    std::vector<std::unique_ptr<BuiltinFont>> fallbacks_;

    std::uint32_t nextFontId_ = 1;
};

} // namespace freqcard::text

#endif // FREQCARD_TEXT_FONT_MANAGER_H
