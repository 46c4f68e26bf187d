#include "freqcard/layout/layout_config.h"

#include <algorithm>

namespace freqcard::layout {

float LayoutConfig::trackingFor(TextElement element) const {
    auto it = trackingByElement.find(element);
    return it != trackingByElement.end() ? it->second : 0.0f;
}

LayoutConfig LayoutConfig::forCanvas(float canvasWidth, float tagFontSize) {
    LayoutConfig config;
    config.pillHeight = tagFontSize + 2.0f * config.paddingY;
    config.rowMaxWidth = std::max(0.0f, canvasWidth - 2.0f * kMargin);
    config.trackingByElement[TextElement::Frequency] = -8.0f;
    config.trackingByElement[TextElement::RadioName] = -8.0f;
    return config;
}

} // namespace freqcard::layout
