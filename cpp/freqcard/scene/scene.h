#ifndef FREQCARD_SCENE_SCENE_H
#define FREQCARD_SCENE_SCENE_H

#include "freqcard/core/types.h"
#include "freqcard/layout/layout_types.h"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace freqcard::scene {

enum class SceneId : std::uint8_t {
    Atrium = 0,
    Refuge = 1,
};

struct ScenePalette {
    Color accent;               // Scene-name pill and highlighted tags
    Color neutral;              // Other tags
    Color pillText;
};

struct SceneInfo {
    SceneId id;
    std::string displayName;    // "L'Atrium", "Le Refuge"
    std::string backgroundFile; // Relative to the asset directory
    ScenePalette palette;
};

/**
 * All recognized scenes.
 */
const std::vector<SceneInfo>& knownScenes();

/**
 * Look up a scene by name, ignoring ASCII case.
 * @throws ConfigurationError for any other name
 */
const SceneInfo& resolveScene(std::string_view name);

/**
 * Background template path: <assetDir>/<backgroundFile>.
 */
std::string backgroundPath(const SceneInfo& scene, const std::string& assetDir);

/**
 * "output_<name>.png" with the name lowercased, apostrophes removed and
 * spaces replaced by underscores ("L'Atrium" -> "output_latrium.png").
 */
std::string defaultOutputName(std::string_view sceneName);

Color pillColor(const ScenePalette& palette, layout::BackgroundStyle style);

} // namespace freqcard::scene

#endif // FREQCARD_SCENE_SCENE_H
