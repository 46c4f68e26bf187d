#include "freqcard/scene/scene.h"
#include "freqcard/core/errors.h"
#include "freqcard/core/string_utils.h"

namespace freqcard::scene {

namespace {

constexpr Color kNeutralPill{255, 255, 255, 220};
constexpr Color kPillText{31, 41, 55, 255};

} // namespace

const std::vector<SceneInfo>& knownScenes() {
    static const std::vector<SceneInfo> scenes = {
        {SceneId::Atrium, "L'Atrium", "orange.png", {Color{255, 134, 53, 255}, kNeutralPill, kPillText}},
        {SceneId::Refuge, "Le Refuge", "purple.png", {Color{182, 140, 254, 220}, kNeutralPill, kPillText}},
    };
    return scenes;
}

const SceneInfo& resolveScene(std::string_view name) {
    const std::string wanted = toLowerAscii(name);
    for (const SceneInfo& scene : knownScenes()) {
        if (toLowerAscii(scene.displayName) == wanted) {
            return scene;
        }
    }
    throw ConfigurationError(
        "Unknown scene_name: " + std::string(name) + ". Must be 'Le Refuge' or 'L'Atrium'");
}

std::string backgroundPath(const SceneInfo& scene, const std::string& assetDir) {
    if (assetDir.empty()) {
        return scene.backgroundFile;
    }
    if (assetDir.back() == '/') {
        return assetDir + scene.backgroundFile;
    }
    return assetDir + "/" + scene.backgroundFile;
}

std::string defaultOutputName(std::string_view sceneName) {
    std::string safe;
    for (char c : toLowerAscii(sceneName)) {
        if (c == '\'') {
            continue;
        }
        safe += (c == ' ') ? '_' : c;
    }
    return "output_" + safe + ".png";
}

Color pillColor(const ScenePalette& palette, layout::BackgroundStyle style) {
    return style == layout::BackgroundStyle::Accent ? palette.accent : palette.neutral;
}

} // namespace freqcard::scene
