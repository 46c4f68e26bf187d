#ifndef FREQCARD_CARD_GENERATOR_H
#define FREQCARD_CARD_GENERATOR_H

#include "freqcard/card_layout.h"
#include "freqcard/layout/layout_config.h"
#include "freqcard/render/canvas.h"
#include "freqcard/scene/scene.h"
#include "freqcard/text/font_manager.h"
#include <cstdint>
#include <string>
#include <vector>

namespace freqcard {

struct CardOutput {
    std::string path;                   // OutputMode::File
    std::vector<std::uint8_t> png;      // OutputMode::Buffer
    CardLayout layout;
};

/**
 * CardGenerator: composes a scene card from a request.
 *
 * Steps: resolve the scene, load its background template, load the element
 * fonts (builtin font on failure), compute the CardLayout, paint it, then
 * write or encode the PNG.
 *
 * Errors:
 * - ConfigurationError: unknown scene, bad fixed-slot tag count
 * - AssetError: background missing/undecodable, output not writable
 */
class CardGenerator {
public:
    CardGenerator();
    explicit CardGenerator(const CardFonts& fonts);
    ~CardGenerator() = default;

    CardGenerator(const CardGenerator&) = delete;
    CardGenerator& operator=(const CardGenerator&) = delete;

    CardOutput generate(const CardRequest& request);

    /**
     * Paint a computed layout onto `canvas`.
     * @return Number of draw calls issued
     */
    std::size_t paint(
        render::Canvas& canvas,
        const CardLayout& card,
        const CardFontSet& fonts,
        const scene::ScenePalette& palette
    ) const;

    /**
     * Load (or reuse) every element font from `assetDir`.
     */
    CardFontSet loadFonts(const std::string& assetDir);

    static constexpr Color kWhite{255, 255, 255, 255};
    static constexpr Color kBlack{0, 0, 0, 255};

private:
    CardFonts fonts_;
    text::FontManager fontManager_;

    std::string assetPath(const std::string& assetDir, const std::string& file) const;
};

} // namespace freqcard

#endif // FREQCARD_CARD_GENERATOR_H
