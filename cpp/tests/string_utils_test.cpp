#include <gtest/gtest.h>
#include "freqcard/core/string_utils.h"

using namespace freqcard;

TEST(StringUtilsTest, CodepointCountIgnoresByteLength) {
    EXPECT_EQ(codepointCount(""), 0u);
    EXPECT_EQ(codepointCount("abc"), 3u);
    EXPECT_EQ(codepointCount("R\xC3\xA9v\xC3\xA9lateur"), 10u);   // Révélateur
}

TEST(StringUtilsTest, DecodeUtf8) {
    const std::vector<std::uint32_t> cps = decodeUtf8("a\xC3\xA9\xE2\x82\xAC");
    ASSERT_EQ(cps.size(), 3u);
    EXPECT_EQ(cps[0], 0x61u);
    EXPECT_EQ(cps[1], 0xE9u);
    EXPECT_EQ(cps[2], 0x20ACu);
}

TEST(StringUtilsTest, MalformedSequenceDecodesToReplacement) {
    const std::vector<std::uint32_t> cps = decodeUtf8("\xC3" "a");
    ASSERT_EQ(cps.size(), 2u);
    EXPECT_EQ(cps[0], 0xFFFDu);
    EXPECT_EQ(cps[1], 0x61u);
}

TEST(StringUtilsTest, DropLastCodepointsKeepsSequencesWhole) {
    EXPECT_EQ(dropLastCodepoints("caf\xC3\xA9", 1), "caf");
    EXPECT_EQ(dropLastCodepoints("\xC3\xA9t\xC3\xA9", 2), "\xC3\xA9");
    EXPECT_EQ(dropLastCodepoints("abc", 3), "");
    EXPECT_EQ(dropLastCodepoints("abc", 10), "");
}

TEST(StringUtilsTest, SplitWordsCollapsesWhitespace) {
    const std::vector<std::string> words = splitWords("  Radio \t Campus\nParis  ");
    ASSERT_EQ(words.size(), 3u);
    EXPECT_EQ(words[0], "Radio");
    EXPECT_EQ(words[1], "Campus");
    EXPECT_EQ(words[2], "Paris");

    EXPECT_TRUE(splitWords("").empty());
    EXPECT_TRUE(splitWords("   ").empty());
}

TEST(StringUtilsTest, JoinWords) {
    const std::vector<std::string> words = {"a", "bb", "ccc"};
    EXPECT_EQ(joinWords(words), "a bb ccc");
    EXPECT_EQ(joinWords(words, 2), "a bb");
    EXPECT_EQ(joinWords(words, 0), "");
}

TEST(StringUtilsTest, ToLowerAsciiLeavesMultibyteAlone) {
    EXPECT_EQ(toLowerAscii("L'ATRIUM"), "l'atrium");
    EXPECT_EQ(toLowerAscii("\xC3\x89t\xC3\xA9"), "\xC3\x89t\xC3\xA9");
}
