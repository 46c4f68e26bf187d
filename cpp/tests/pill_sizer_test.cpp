#include <gtest/gtest.h>
#include "freqcard/layout/pill_sizer.h"
#include "freqcard/text/builtin_font.h"
#include "freqcard/text/font_manager.h"
#include <string>
#include <vector>

using namespace freqcard;
using namespace freqcard::layout;

// BuiltinFont(10): advance 6, ink box (0,0)-(6n,10), ascender 8, descender -2
class PillSizerTest : public ::testing::Test {
protected:
    text::BuiltinFont font{10.0f};
};

TEST_F(PillSizerTest, WidthIsTextPlusPadding) {
    EXPECT_FLOAT_EQ(PillSizer::pillWidth("abc", font, 30.0f), 78.0f);
    EXPECT_FLOAT_EQ(PillSizer::pillWidth("", font, 30.0f), 60.0f);
}

TEST_F(PillSizerTest, PillBoxHasFixedHeight) {
    const LayoutBox box = PillSizer::pillBox("abc", font, 30.0f, 72.0f, Point{5.0f, 7.0f});
    EXPECT_FLOAT_EQ(box.x, 5.0f);
    EXPECT_FLOAT_EQ(box.y, 7.0f);
    EXPECT_FLOAT_EQ(box.width, 78.0f);
    EXPECT_FLOAT_EQ(box.height, 72.0f);
    EXPECT_FLOAT_EQ(box.right(), 83.0f);
    EXPECT_FLOAT_EQ(box.bottom(), 79.0f);
}

TEST_F(PillSizerTest, InkFitBoxHugsInk) {
    const LayoutBox box = PillSizer::inkFitBox("abc", font, 30.0f, 15.0f);
    EXPECT_FLOAT_EQ(box.width, 78.0f);
    EXPECT_FLOAT_EQ(box.height, 40.0f);
}

TEST_F(PillSizerTest, CenterTextAppliesBaselineCorrection) {
    const LayoutBox pill{0.0f, 0.0f, 78.0f, 72.0f};
    const Point origin = PillSizer::centerText("abc", font, pill, -2.0f);
    EXPECT_FLOAT_EQ(origin.x, 30.0f);
    // (72 - (8 + 2)) / 2 - 2
    EXPECT_FLOAT_EQ(origin.y, 29.0f);

    const Point uncorrected = PillSizer::centerText("abc", font, pill, 0.0f);
    EXPECT_FLOAT_EQ(uncorrected.y - origin.y, 2.0f);
}

TEST_F(PillSizerTest, CenterTextFollowsPillPosition) {
    const LayoutBox pill{100.0f, 200.0f, 78.0f, 72.0f};
    const Point origin = PillSizer::centerText("abc", font, pill, -2.0f);
    EXPECT_FLOAT_EQ(origin.x, 130.0f);
    EXPECT_FLOAT_EQ(origin.y, 229.0f);
}

TEST_F(PillSizerTest, CenterInkFloorsOffsets) {
    const LayoutBox pill{0.0f, 0.0f, 79.0f, 41.0f};
    const Point origin = PillSizer::centerInk("abc", font, pill);
    EXPECT_FLOAT_EQ(origin.x, 30.0f);
    EXPECT_FLOAT_EQ(origin.y, 15.0f);
}

// =============================================================================
// Real font: left bearing is compensated
// =============================================================================

TEST(PillSizerFontTest, InkIsCenteredWithRealFont) {
    text::FontManager fontManager;
    ASSERT_TRUE(fontManager.initialize());

    const std::vector<std::string> fontPaths = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/liberation-sans/LiberationSans-Regular.ttf",
        "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
    };
    std::uint32_t fontId = 0;
    for (const std::string& path : fontPaths) {
        fontId = fontManager.loadFontFromFile(path, 42.0f);
        if (fontId != 0) break;
    }
    if (fontId == 0) {
        GTEST_SKIP() << "No system font available for testing";
    }
    const text::Font& font = *fontManager.getFont(fontId);

    const LayoutBox pill = PillSizer::pillBox("Paisible", font, 30.0f, 72.0f, Point{66.0f, 1300.0f});
    const Point origin = PillSizer::centerText("Paisible", font, pill, -2.0f);
    const text::TextBounds ink = font.bounds("Paisible");

    const float leftGap = (origin.x + ink.x0) - pill.x;
    const float rightGap = pill.right() - (origin.x + ink.x1);
    EXPECT_NEAR(leftGap, rightGap, 0.01f);
    EXPECT_NEAR(leftGap, 30.0f, 0.01f);

    fontManager.shutdown();
}
