#include "freqcard/card_layout.h"
#include "freqcard/layout/pill_sizer.h"
#include "freqcard/text/text_measurer.h"

#include <cmath>
#include <random>

namespace freqcard {

namespace {

std::vector<layout::Label> packingInput(const CardRequest& request) {
    std::vector<layout::Label> labels;
    if (request.policy == layout::PackingPolicy::FixedSlot) {
        for (const std::string& tag : request.tags) {
            labels.push_back(layout::Label::make(layout::LabelCategory::Tag, tag));
        }
        return labels;
    }

    labels = request.labels;
    for (const std::string& tag : request.tags) {
        labels.push_back(layout::Label::make(layout::LabelCategory::Tag, tag));
    }
    return labels;
}

} // namespace

CardLayout buildCardLayout(
    const CardRequest& request,
    const CardFontSet& fonts,
    const layout::LayoutConfig& config,
    int canvasWidth,
    int canvasHeight,
    const CardAnchors& anchors
) {
    CardLayout card;
    card.canvasWidth = canvasWidth;
    card.canvasHeight = canvasHeight;

    // Frequency
    card.frequency.text = request.frequency + " FM";
    card.frequency.origin = anchors.frequency;
    card.frequency.tracking = config.trackingFor(layout::TextElement::Frequency);

    // Genre line followed by the scene-name pill
    card.genre.text = request.sceneGenre + " dans";
    card.genre.origin = anchors.genre;
    card.genre.tracking = config.trackingFor(layout::TextElement::Genre);

    const text::TextBounds genreInk = fonts.genre->bounds(card.genre.text);
    card.sceneNameText = request.sceneName;
    card.sceneNamePill = layout::PillSizer::inkFitBox(
        request.sceneName, *fonts.sceneName, anchors.sceneNamePaddingX, anchors.sceneNamePaddingY);
    card.sceneNamePill.x = anchors.genre.x + genreInk.width() + anchors.sceneNameGap + anchors.sceneNameOffset.x;
    card.sceneNamePill.y = anchors.genre.y +
        std::floor((genreInk.height() - card.sceneNamePill.height) * 0.5f) + anchors.sceneNameOffset.y;
    card.sceneNameTextOrigin = layout::PillSizer::centerInk(
        request.sceneName, *fonts.sceneName, card.sceneNamePill);

    // Date
    card.date.text = request.dateText;
    card.date.origin = anchors.date;
    card.date.tracking = config.trackingFor(layout::TextElement::Date);

    // Radio station name, wrapped
    card.radioTracking = config.trackingFor(layout::TextElement::RadioName);
    const float radioMaxWidth = static_cast<float>(canvasWidth) - anchors.radioRightMargin;
    card.radioLines = text::LineWrapper::wrap(
        request.radioStationName, *fonts.radioName, radioMaxWidth, request.maxRadioLines, card.radioTracking);
    text::LineWrapper::positionLines(
        card.radioLines, anchors.radioName,
        text::LineWrapper::lineStep(*fonts.radioName, anchors.radioLineSpacing));

    // Tag pills
    const std::vector<layout::Label> labels = packingInput(request);
    if (request.policy == layout::PackingPolicy::FixedSlot && labels.empty()) {
        return card;
    }
    layout::PillPacker packer(*fonts.tags, config);
    std::mt19937 rng(request.shuffleSeed);
    card.tags = packer.pack(request.policy, labels, anchors.tags, rng);

    return card;
}

} // namespace freqcard
