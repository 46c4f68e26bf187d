#include <gtest/gtest.h>
#include "freqcard/text/builtin_font.h"
#include "freqcard/text/text_measurer.h"

using namespace freqcard::text;

// BuiltinFont(10): every codepoint advances 6px, ink spans the full advance.
class TextMeasurerTest : public ::testing::Test {
protected:
    BuiltinFont font{10.0f};
};

TEST_F(TextMeasurerTest, EmptyStringHasZeroWidth) {
    EXPECT_FLOAT_EQ(TextMeasurer::width("", font), 0.0f);
    EXPECT_FLOAT_EQ(TextMeasurer::width("", font, -8.0f), 0.0f);
    EXPECT_FLOAT_EQ(TextMeasurer::drawAdvance("", font, -8.0f), 0.0f);
}

TEST_F(TextMeasurerTest, UntrackedWidthIsInkWidth) {
    EXPECT_FLOAT_EQ(TextMeasurer::width("abc", font), 18.0f);
    EXPECT_FLOAT_EQ(TextMeasurer::width("abc", font), font.bounds("abc").width());
}

TEST_F(TextMeasurerTest, TrackingCountsBetweenCharacters) {
    // 3 advances + 2 gaps
    EXPECT_FLOAT_EQ(TextMeasurer::width("abc", font, -1.0f), 16.0f);
    EXPECT_FLOAT_EQ(TextMeasurer::width("abc", font, 2.0f), 22.0f);
    // A single character has no gap to track
    EXPECT_FLOAT_EQ(TextMeasurer::width("a", font, -8.0f), 6.0f);
}

TEST_F(TextMeasurerTest, DrawAdvanceTracksEveryCharacter) {
    EXPECT_FLOAT_EQ(TextMeasurer::drawAdvance("abc", font, -1.0f), 15.0f);
    EXPECT_FLOAT_EQ(TextMeasurer::drawAdvance("abc", font, -1.0f),
                    TextMeasurer::width("abc", font, -1.0f) - 1.0f);
}

TEST_F(TextMeasurerTest, AdvanceSum) {
    EXPECT_FLOAT_EQ(TextMeasurer::advanceSum("abcd", font), 24.0f);
}

TEST_F(TextMeasurerTest, MeasuresCodepointsNotBytes) {
    // "été" is 5 bytes, 3 codepoints
    EXPECT_FLOAT_EQ(TextMeasurer::width("\xC3\xA9t\xC3\xA9", font), 18.0f);
    EXPECT_FLOAT_EQ(TextMeasurer::width("\xC3\xA9t\xC3\xA9", font, -1.0f), 16.0f);
}
