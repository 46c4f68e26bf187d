#include "freqcard/text/text_measurer.h"
#include "freqcard/core/string_utils.h"

namespace freqcard::text {

float TextMeasurer::width(std::string_view text, const Font& font, float tracking) {
    if (text.empty()) {
        return 0.0f;
    }
    if (tracking == 0.0f) {
        return font.bounds(text).width();
    }

    float total = 0.0f;
    std::size_t count = 0;
    for (std::uint32_t cp : decodeUtf8(text)) {
        total += font.advanceWidth(cp);
        ++count;
    }
    return total + tracking * static_cast<float>(count - 1);
}

float TextMeasurer::drawAdvance(std::string_view text, const Font& font, float tracking) {
    float total = 0.0f;
    for (std::uint32_t cp : decodeUtf8(text)) {
        total += font.advanceWidth(cp) + tracking;
    }
    return total;
}

float TextMeasurer::advanceSum(std::string_view text, const Font& font) {
    return drawAdvance(text, font, 0.0f);
}

} // namespace freqcard::text
