#include "freqcard/text/line_wrapper.h"
#include "freqcard/text/text_measurer.h"
#include "freqcard/core/string_utils.h"

namespace freqcard::text {

std::vector<WrappedLine> LineWrapper::wrap(
    std::string_view text,
    const Font& font,
    float maxWidth,
    std::optional<std::size_t> maxLines,
    float tracking
) {
    std::vector<WrappedLine> lines;
    const std::vector<std::string> words = splitWords(text);
    if (words.empty() || (maxLines && *maxLines == 0)) {
        return lines;
    }

    std::vector<std::string> current;
    auto closeLine = [&]() {
        WrappedLine line;
        line.text = joinWords(current);
        line.wordCount = current.size();
        line.width = TextMeasurer::width(line.text, font, tracking);
        lines.push_back(std::move(line));
        current.clear();
    };

    for (const std::string& word : words) {
        current.push_back(word);
        const float candidateWidth = TextMeasurer::width(joinWords(current), font, tracking);
        if (candidateWidth <= maxWidth || current.size() == 1) {
            // A lone overflowing word is accepted as-is
            continue;
        }
        current.pop_back();
        closeLine();
        current.push_back(word);
    }
    if (!current.empty()) {
        closeLine();
    }

    if (maxLines && lines.size() > *maxLines) {
        lines.resize(*maxLines);
        ellipsizeLastLine(lines.back(), font, maxWidth, tracking);
    }

    return lines;
}

void LineWrapper::ellipsizeLastLine(
    WrappedLine& line,
    const Font& font,
    float maxWidth,
    float tracking
) {
    std::vector<std::string> kept = splitWords(line.text);
    const float ellipsisWidth = TextMeasurer::width(kEllipsis, font);

    // Strictly shrinking; floor is one word
    while (kept.size() > 1) {
        const float advance = TextMeasurer::drawAdvance(joinWords(kept), font, tracking);
        if (advance + ellipsisWidth <= maxWidth) {
            break;
        }
        kept.pop_back();
    }

    line.text = joinWords(kept);
    line.wordCount = kept.size();
    line.width = TextMeasurer::width(line.text, font, tracking);
    line.ellipsized = true;
    line.ellipsisX = TextMeasurer::drawAdvance(line.text, font, tracking);
}

void LineWrapper::positionLines(std::vector<WrappedLine>& lines, Point origin, float lineStep) {
    for (std::size_t i = 0; i < lines.size(); ++i) {
        lines[i].origin.x = origin.x;
        lines[i].origin.y = origin.y + static_cast<float>(i) * lineStep;
    }
}

} // namespace freqcard::text
