#include "freqcard/card_generator.h"
#include "freqcard/core/errors.h"
#include "freqcard/core/logging.h"
#include "freqcard/render/renderer.h"

#include <fstream>

namespace freqcard {

CardGenerator::CardGenerator()
    : CardGenerator(CardFonts{})
{
}

CardGenerator::CardGenerator(const CardFonts& fonts)
    : fonts_(fonts)
{
    if (!fontManager_.initialize()) {
        FREQCARD_LOG_WARN("font system unavailable, every element uses the builtin font");
    }
}

std::string CardGenerator::assetPath(const std::string& assetDir, const std::string& file) const {
    if (assetDir.empty()) {
        return file;
    }
    return assetDir.back() == '/' ? assetDir + file : assetDir + "/" + file;
}

CardFontSet CardGenerator::loadFonts(const std::string& assetDir) {
    auto load = [&](const FontSpec& spec) {
        return &fontManager_.loadFontOrFallback(assetPath(assetDir, spec.file), spec.size);
    };

    CardFontSet set;
    set.frequency = load(fonts_.frequency);
    set.genre = load(fonts_.genre);
    set.sceneName = load(fonts_.sceneName);
    set.date = load(fonts_.date);
    set.radioName = load(fonts_.radioName);
    set.tags = load(fonts_.tags);
    return set;
}

CardOutput CardGenerator::generate(const CardRequest& request) {
    const scene::SceneInfo& sceneInfo = scene::resolveScene(request.sceneName);

    const std::string bgPath = scene::backgroundPath(sceneInfo, request.assetDir);
    if (!std::ifstream(bgPath, std::ios::binary).good()) {
        throw AssetError("Background image not found: " + bgPath);
    }
    render::Canvas canvas = render::Canvas::loadPng(bgPath);

    const CardFontSet fonts = loadFonts(request.assetDir);
    const layout::LayoutConfig config =
        layout::LayoutConfig::forCanvas(static_cast<float>(canvas.width()), fonts_.tags.size);

    CardOutput output;
    output.layout = buildCardLayout(request, fonts, config, canvas.width(), canvas.height());

    const std::size_t calls = paint(canvas, output.layout, fonts, sceneInfo.palette);
    FREQCARD_LOG_DEBUG("painted %zu element(s) on %dx%d canvas", calls, canvas.width(), canvas.height());

    if (request.outputMode == OutputMode::Buffer) {
        output.png = canvas.encodePng();
        return output;
    }

    output.path = request.outputPath.empty()
        ? scene::defaultOutputName(request.sceneName)
        : request.outputPath;
    canvas.savePng(output.path);
    FREQCARD_LOG_DEBUG("wrote %s", output.path.c_str());
    return output;
}

std::size_t CardGenerator::paint(
    render::Canvas& canvas,
    const CardLayout& card,
    const CardFontSet& fonts,
    const scene::ScenePalette& palette
) const {
    render::Renderer renderer(canvas);
    auto drawItem = [&](const text::Font& font, const TextItem& item, Color color) {
        if (item.tracking != 0.0f) {
            renderer.drawTrackedText(font, item.text, item.origin, color, item.tracking);
        } else {
            renderer.drawText(font, item.text, item.origin, color);
        }
    };

    drawItem(*fonts.frequency, card.frequency, kWhite);

    drawItem(*fonts.genre, card.genre, kBlack);
    renderer.drawPill(*fonts.sceneName, card.sceneNamePill, card.sceneNameText,
                      card.sceneNameTextOrigin, palette.accent, palette.pillText);

    drawItem(*fonts.date, card.date, kBlack);

    renderer.drawWrappedLines(*fonts.radioName, card.radioLines, kWhite, card.radioTracking);

    renderer.drawPacking(*fonts.tags, card.tags, palette);

    return renderer.drawCalls();
}

} // namespace freqcard
