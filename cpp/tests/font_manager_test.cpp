#include <gtest/gtest.h>
#include "freqcard/text/font_manager.h"
#include "freqcard/text/text_measurer.h"
#include <string>
#include <vector>

using namespace freqcard::text;

// =============================================================================
// Test Fixture with Font Setup
// =============================================================================

class FontManagerTest : public ::testing::Test {
protected:
    FontManager fontManager;

    bool fontLoaded = false;
    std::uint32_t testFontId = 0;
    std::string testFontPath;

    void SetUp() override {
        ASSERT_TRUE(fontManager.initialize());

        std::vector<std::string> fontPaths = {
            "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
            "/usr/share/fonts/TTF/DejaVuSans.ttf",
            "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
            "/usr/share/fonts/liberation-sans/LiberationSans-Regular.ttf",
            "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
            "/System/Library/Fonts/Helvetica.ttc",  // macOS
            "C:\\Windows\\Fonts\\arial.ttf"          // Windows
        };

        for (const std::string& path : fontPaths) {
            testFontId = fontManager.loadFontFromFile(path, 42.0f);
            if (testFontId != 0) {
                fontLoaded = true;
                testFontPath = path;
                break;
            }
        }
    }

    void TearDown() override {
        fontManager.shutdown();
    }
};

// =============================================================================
// Lifecycle
// =============================================================================

TEST_F(FontManagerTest, Initialization) {
    EXPECT_TRUE(fontManager.isInitialized());
    fontManager.shutdown();
    EXPECT_FALSE(fontManager.isInitialized());
    EXPECT_EQ(fontManager.getFont(testFontId), nullptr);
}

TEST_F(FontManagerTest, MissingFileReturnsZero) {
    EXPECT_EQ(fontManager.loadFontFromFile("/nonexistent/font.ttf", 42.0f), 0u);
}

TEST_F(FontManagerTest, GarbageDataReturnsZero) {
    const std::uint8_t junk[] = {0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07};
    EXPECT_EQ(fontManager.loadFontFromMemory(junk, sizeof(junk), 42.0f), 0u);
    EXPECT_EQ(fontManager.loadFontFromMemory(nullptr, 0, 42.0f), 0u);
}

TEST_F(FontManagerTest, LoadingBeforeInitializeFails) {
    FontManager uninitialized;
    EXPECT_EQ(uninitialized.loadFontFromFile("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf", 42.0f), 0u);
    EXPECT_TRUE(uninitialized.loadFontOrFallback("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf", 42.0f)
                    .isFallback());
}

// =============================================================================
// Fallback
// =============================================================================

TEST_F(FontManagerTest, MissingFileFallsBackToBuiltin) {
    const Font& font = fontManager.loadFontOrFallback("/nonexistent/Obviously-MediumItalic.otf", 127.0f);
    EXPECT_TRUE(font.isFallback());
    EXPECT_FLOAT_EQ(font.size(), 127.0f);
    EXPECT_GT(TextMeasurer::width("Radio", font), 0.0f);
}

TEST_F(FontManagerTest, FallbackIsCached) {
    const Font& a = fontManager.loadFontOrFallback("/nonexistent/a.ttf", 42.0f);
    const Font& b = fontManager.loadFontOrFallback("/nonexistent/a.ttf", 42.0f);
    EXPECT_EQ(&a, &b);
    EXPECT_EQ(&fontManager.fallbackFont(42.0f), &fontManager.fallbackFont(42.0f));
    EXPECT_NE(&fontManager.fallbackFont(42.0f), &fontManager.fallbackFont(60.0f));
}

// =============================================================================
// FreeType / HarfBuzz fonts
// =============================================================================

TEST_F(FontManagerTest, FontLoading) {
    if (!fontLoaded) {
        GTEST_SKIP() << "No system font available for testing";
    }

    EXPECT_NE(testFontId, 0u);

    const FreeTypeFont* font = fontManager.getFont(testFontId);
    ASSERT_NE(font, nullptr);
    EXPECT_FALSE(font->isFallback());
    EXPECT_FLOAT_EQ(font->size(), 42.0f);
    EXPECT_EQ(fontManager.getFont(0), nullptr);
    EXPECT_EQ(fontManager.getFont(testFontId + 100), nullptr);
}

TEST_F(FontManagerTest, FontMetrics) {
    if (!fontLoaded) {
        GTEST_SKIP() << "No system font available for testing";
    }

    const FontMetrics metrics = fontManager.getFont(testFontId)->metrics();
    EXPECT_GT(metrics.ascender, 0.0f);
    EXPECT_LT(metrics.descender, 0.0f);
    EXPECT_GT(metrics.unitsPerEM, 0.0f);
    EXPECT_GT(metrics.lineHeight(), 0.0f);
}

TEST_F(FontManagerTest, LoadOrFallbackReusesLoadedFont) {
    if (!fontLoaded) {
        GTEST_SKIP() << "No system font available for testing";
    }

    const Font& a = fontManager.loadFontOrFallback(testFontPath, 60.0f);
    const Font& b = fontManager.loadFontOrFallback(testFontPath, 60.0f);
    EXPECT_FALSE(a.isFallback());
    EXPECT_EQ(&a, &b);
    EXPECT_FLOAT_EQ(a.size(), 60.0f);
}

TEST_F(FontManagerTest, ShapingAndMeasurement) {
    if (!fontLoaded) {
        GTEST_SKIP() << "No system font available for testing";
    }
    const Font& font = *fontManager.getFont(testFontId);

    const std::vector<PositionedGlyph> run = font.layoutRun("Paisible");
    ASSERT_EQ(run.size(), 8u);
    for (std::size_t i = 1; i < run.size(); ++i) {
        EXPECT_GT(run[i].x, run[i - 1].x);
    }

    EXPECT_GT(font.advanceWidth('W'), font.advanceWidth('i'));

    const TextBounds bounds = font.bounds("Paisible");
    EXPECT_GT(bounds.width(), 0.0f);
    EXPECT_GT(bounds.height(), 0.0f);

    // Tracked width: advances plus 7 gaps
    const float tracked = TextMeasurer::width("Paisible", font, -8.0f);
    EXPECT_NEAR(tracked, TextMeasurer::advanceSum("Paisible", font) - 56.0f, 0.01f);
}

TEST_F(FontManagerTest, Rasterize) {
    if (!fontLoaded) {
        GTEST_SKIP() << "No system font available for testing";
    }
    const Font& font = *fontManager.getFont(testFontId);

    const std::vector<PositionedGlyph> run = font.layoutRun("A ");
    ASSERT_EQ(run.size(), 2u);

    const std::optional<GlyphBitmap> glyph = font.rasterize(run[0]);
    ASSERT_TRUE(glyph.has_value());
    EXPECT_GT(glyph->width, 0);
    EXPECT_GT(glyph->height, 0);
    EXPECT_EQ(glyph->coverage.size(), static_cast<std::size_t>(glyph->width * glyph->height));

    // Space has no ink
    EXPECT_FALSE(font.rasterize(run[1]).has_value());
}

TEST_F(FontManagerTest, HandedOutFontsOutliveLaterLoads) {
    if (!fontLoaded) {
        GTEST_SKIP() << "No system font available for testing";
    }

    const Font& tags = fontManager.loadFontOrFallback(testFontPath, 42.0f);
    const float width = TextMeasurer::width("Paisible", tags);

    for (float size : {20.0f, 60.0f, 127.0f, 174.0f}) {
        EXPECT_NE(fontManager.loadFontFromFile(testFontPath, size), 0u);
        EXPECT_FALSE(fontManager.loadFontOrFallback(testFontPath, size).isFallback());
    }

    EXPECT_EQ(&fontManager.loadFontOrFallback(testFontPath, 42.0f), &tags);
    EXPECT_FLOAT_EQ(TextMeasurer::width("Paisible", tags), width);
}
