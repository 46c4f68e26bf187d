#ifndef FREQCARD_CARD_LAYOUT_H
#define FREQCARD_CARD_LAYOUT_H

#include "freqcard/core/types.h"
#include "freqcard/layout/layout_config.h"
#include "freqcard/layout/layout_types.h"
#include "freqcard/layout/pill_packer.h"
#include "freqcard/text/font.h"
#include "freqcard/text/line_wrapper.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace freqcard {

enum class OutputMode : std::uint8_t {
    File = 0,       // Write a PNG file, report its path
    Buffer = 1,     // Return the encoded PNG bytes
};

// Everything a scene card shows
struct CardRequest {
    std::string frequency;              // "97.3"
    std::string sceneGenre;             // "House solaire"
    std::string sceneName;              // "L'Atrium" or "Le Refuge"
    std::string radioStationName;
    std::vector<std::string> tags;      // Fixed slot: exactly 5
    std::vector<layout::Label> labels;  // Extra labels for greedy flow
    layout::PackingPolicy policy = layout::PackingPolicy::FixedSlot;
    std::uint32_t shuffleSeed = layout::PillPacker::kDefaultShuffleSeed;
    std::optional<std::size_t> maxRadioLines;
    std::string dateText = "le 31 juillet \xC3\xA0 La Rotonde";

    std::string assetDir = "assets";
    OutputMode outputMode = OutputMode::File;
    std::string outputPath;             // Empty: scene::defaultOutputName()
};

struct FontSpec {
    std::string file;                   // Relative to the asset directory
    float size;
};

// Font asset and pixel size per element
struct CardFonts {
    FontSpec frequency{"Obviously-MediumItalic.otf", 174.0f};
    FontSpec genre{"DarkerGrotesque-SemiBold.ttf", 60.0f};
    FontSpec sceneName{"DarkerGrotesque-ExtraBold.ttf", 54.0f};
    FontSpec date{"DarkerGrotesque-ExtraBold.ttf", 80.0f};
    FontSpec radioName{"Obviously-MediumItalic.otf", 127.0f};
    FontSpec tags{"DarkerGrotesque-ExtraBold.ttf", 42.0f};
};

// Loaded fonts, one per element (not owned)
struct CardFontSet {
    const text::Font* frequency = nullptr;
    const text::Font* genre = nullptr;
    const text::Font* sceneName = nullptr;
    const text::Font* date = nullptr;
    const text::Font* radioName = nullptr;
    const text::Font* tags = nullptr;
};

// Fixed anchor points of the poster template
struct CardAnchors {
    Point frequency{66.0f, 311.0f};
    Point genre{66.0f, 460.0f};
    Point date{66.0f, 520.0f};
    Point radioName{66.0f, 800.0f};
    Point tags{66.0f, 1300.0f};

    float sceneNameGap = 24.0f;         // Genre text to scene-name pill
    Point sceneNameOffset{0.0f, 30.0f};
    float sceneNamePaddingX = 30.0f;
    float sceneNamePaddingY = 15.0f;
    float radioRightMargin = 200.0f;    // maxWidth = canvasWidth - this
    float radioLineSpacing = 8.0f;
};

struct TextItem {
    std::string text;
    Point origin;                       // Pen origin on the ascender line
    float tracking = 0.0f;
};

// Resolved geometry of a whole card
struct CardLayout {
    int canvasWidth = 0;
    int canvasHeight = 0;

    TextItem frequency;
    TextItem genre;
    TextItem date;

    std::string sceneNameText;
    LayoutBox sceneNamePill;
    Point sceneNameTextOrigin;

    std::vector<text::WrappedLine> radioLines;
    float radioTracking = 0.0f;

    layout::PackingResult tags;
};

/**
 * Compute the layout of a card on a canvas of the given size.
 * @throws ConfigurationError for fixed-slot packing with a tag count other than 0 or 5
 */
CardLayout buildCardLayout(
    const CardRequest& request,
    const CardFontSet& fonts,
    const layout::LayoutConfig& config,
    int canvasWidth,
    int canvasHeight,
    const CardAnchors& anchors = CardAnchors{}
);

} // namespace freqcard

#endif // FREQCARD_CARD_LAYOUT_H
