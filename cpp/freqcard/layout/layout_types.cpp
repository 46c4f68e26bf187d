#include "freqcard/layout/layout_types.h"
#include "freqcard/core/string_utils.h"

#include <utility>

namespace freqcard::layout {

BackgroundStyle styleForCategory(LabelCategory category) {
    switch (category) {
        case LabelCategory::Artist:
        case LabelCategory::SceneName:
            return BackgroundStyle::Accent;
        case LabelCategory::Tag:
        case LabelCategory::Verbatim:
        default:
            return BackgroundStyle::Neutral;
    }
}

const char* categoryName(LabelCategory category) {
    switch (category) {
        case LabelCategory::Tag: return "tag";
        case LabelCategory::Verbatim: return "verbatim";
        case LabelCategory::Artist: return "artist";
        case LabelCategory::SceneName: return "scene";
    }
    return "tag";
}

bool parseCategory(const std::string& name, LabelCategory& out) {
    const std::string lower = toLowerAscii(name);
    if (lower == "tag") {
        out = LabelCategory::Tag;
    } else if (lower == "verbatim") {
        out = LabelCategory::Verbatim;
    } else if (lower == "artist") {
        out = LabelCategory::Artist;
    } else if (lower == "scene" || lower == "scenename") {
        out = LabelCategory::SceneName;
    } else {
        return false;
    }
    return true;
}

Label Label::make(LabelCategory category, std::string text) {
    Label label;
    label.category = category;
    label.text = std::move(text);
    label.backgroundStyle = styleForCategory(category);
    return label;
}

} // namespace freqcard::layout
