#include <gtest/gtest.h>
#include "freqcard/card_generator.h"
#include "freqcard/core/errors.h"
#include "freqcard/render/canvas.h"
#include <filesystem>
#include <string>

using namespace freqcard;

// =============================================================================
// Fixture: asset directory with plain backgrounds and no font files, so every
// element renders with the builtin font.
// =============================================================================

class CardGeneratorTest : public ::testing::Test {
protected:
    static constexpr Color kBackground{255, 255, 255, 255};

    std::string assetDir;
    CardRequest request;

    void SetUp() override {
        assetDir = ::testing::TempDir() + "freqcard_assets";
        std::filesystem::create_directories(assetDir);

        render::Canvas background(1080, 1350, kBackground);
        background.savePng(assetDir + "/orange.png");
        background.savePng(assetDir + "/purple.png");

        request.frequency = "97.3";
        request.sceneGenre = "House";
        request.sceneName = "L'Atrium";
        request.radioStationName = "Radio Campus Paris";
        request.tags = {"D\xC3\xA9" "fensif", "Paisible", "R\xC3\xA9v\xC3\xA9lateur", "Percutant", "Hypnotique"};
        request.assetDir = assetDir;
    }
};

TEST_F(CardGeneratorTest, BufferModeReturnsPng) {
    request.outputMode = OutputMode::Buffer;
    CardGenerator generator;
    const CardOutput output = generator.generate(request);

    EXPECT_TRUE(output.path.empty());
    ASSERT_GT(output.png.size(), 8u);
    EXPECT_EQ(output.png[0], 0x89);
    EXPECT_EQ(output.png[1], 'P');
    EXPECT_EQ(output.png[2], 'N');
    EXPECT_EQ(output.png[3], 'G');
    EXPECT_EQ(output.layout.tags.labelCount(), 5u);
}

TEST_F(CardGeneratorTest, FileModeWritesPaintedCard) {
    request.outputPath = ::testing::TempDir() + "freqcard_card.png";
    CardGenerator generator;
    const CardOutput output = generator.generate(request);

    EXPECT_EQ(output.path, request.outputPath);
    EXPECT_TRUE(output.png.empty());

    const render::Canvas card = render::Canvas::loadPng(output.path);
    EXPECT_EQ(card.width(), 1080);
    EXPECT_EQ(card.height(), 1350);

    // Left cap of the scene-name pill carries the accent color
    const LayoutBox& pill = output.layout.sceneNamePill;
    const int x = static_cast<int>(pill.x + 8.0f);
    const int y = static_cast<int>(pill.y + pill.height * 0.5f);
    EXPECT_EQ(card.pixel(x, y), (Color{255, 134, 53, 255}));

    // Far corner untouched
    EXPECT_EQ(card.pixel(1079, 0), kBackground);
}

TEST_F(CardGeneratorTest, MissingFontsFallBackToBuiltin) {
    request.outputMode = OutputMode::Buffer;
    CardGenerator generator;
    const CardFontSet fonts = generator.loadFonts(assetDir);
    EXPECT_TRUE(fonts.frequency->isFallback());
    EXPECT_TRUE(fonts.tags->isFallback());
    EXPECT_FLOAT_EQ(fonts.frequency->size(), 174.0f);
    EXPECT_FLOAT_EQ(fonts.tags->size(), 42.0f);

    EXPECT_NO_THROW(generator.generate(request));
}

TEST_F(CardGeneratorTest, UnknownSceneThrows) {
    request.sceneName = "La Rotonde";
    CardGenerator generator;
    EXPECT_THROW(generator.generate(request), ConfigurationError);
}

TEST_F(CardGeneratorTest, MissingBackgroundThrows) {
    request.assetDir = assetDir + "/missing";
    CardGenerator generator;
    try {
        generator.generate(request);
        FAIL() << "expected AssetError";
    } catch (const AssetError& e) {
        EXPECT_NE(std::string(e.what()).find("Background image not found"), std::string::npos);
    }
}

TEST_F(CardGeneratorTest, WrongTagCountThrows) {
    request.tags = {"one", "two"};
    request.outputMode = OutputMode::Buffer;
    CardGenerator generator;
    EXPECT_THROW(generator.generate(request), ConfigurationError);
}

TEST_F(CardGeneratorTest, GreedyFlowCard) {
    request.policy = layout::PackingPolicy::GreedyFlow;
    request.labels = {layout::Label::make(layout::LabelCategory::Artist, "DJ Nuit")};
    request.outputMode = OutputMode::Buffer;
    CardGenerator generator;
    const CardOutput output = generator.generate(request);

    EXPECT_FALSE(output.png.empty());
    EXPECT_EQ(output.layout.tags.labelCount() + output.layout.tags.droppedCount, 6u);
}

TEST_F(CardGeneratorTest, RefugeUsesItsPalette) {
    request.sceneName = "Le Refuge";
    request.outputPath = ::testing::TempDir() + "freqcard_refuge.png";
    CardGenerator generator;
    const CardOutput output = generator.generate(request);

    const render::Canvas card = render::Canvas::loadPng(output.path);
    const LayoutBox& pill = output.layout.sceneNamePill;
    const Color c = card.pixel(static_cast<int>(pill.x + 8.0f), static_cast<int>(pill.y + pill.height * 0.5f));
    // (182, 140, 254) at alpha 220 over white
    EXPECT_NEAR(c.r, 192, 2);
    EXPECT_NEAR(c.g, 156, 2);
    EXPECT_EQ(c.b, 254);
    EXPECT_EQ(c.a, 255);
}
