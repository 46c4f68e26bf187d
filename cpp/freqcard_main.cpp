#include "freqcard/card_generator.h"
#include "freqcard/core/errors.h"
#include "freqcard/layout/layout_types.h"

#include <iostream>
#include <string>

namespace {

void printHelp(const char* argv0) {
    std::cout << "Usage:\n"
              << "  " << argv0 << " --frequency F --genre G --scene NAME --radio NAME [options]\n\n"
              << "Options:\n"
              << "  --frequency TEXT        Frequency shown as '<TEXT> FM'\n"
              << "  --genre TEXT            Scene genre, followed by 'dans' and the scene pill\n"
              << "  --scene NAME            \"L'Atrium\" or \"Le Refuge\"\n"
              << "  --radio TEXT            Radio station name (wrapped)\n"
              << "  --tag TEXT              Tag pill; fixed policy needs exactly 5 (repeatable)\n"
              << "  --label CAT:TEXT        Extra label for flow policy; CAT is tag, verbatim,\n"
              << "                          artist or scene (repeatable)\n"
              << "  --policy fixed|flow     Pill packing policy (default: fixed)\n"
              << "  --seed N                Shuffle seed for flow policy (default: 42)\n"
              << "  --max-radio-lines N     Ellipsize the radio name after N lines\n"
              << "  --date TEXT             Date line\n"
              << "  --assets DIR            Background and font directory (default: assets)\n"
              << "  --output PATH           Output PNG (default: output_<scene>.png)\n"
              << "  --help                  Show this help\n";
}

enum class ParseResult { Run, Help, Error };

ParseResult parseArgs(int argc, char** argv, freqcard::CardRequest& request) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto needValue = [&](const char* flag) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << flag << "\n";
                return false;
            }
            return true;
        };

        if (a == "--help" || a == "-h") { return ParseResult::Help; }
        else if (a == "--frequency") { if (!needValue("--frequency")) return ParseResult::Error; request.frequency = argv[++i]; }
        else if (a == "--genre") { if (!needValue("--genre")) return ParseResult::Error; request.sceneGenre = argv[++i]; }
        else if (a == "--scene") { if (!needValue("--scene")) return ParseResult::Error; request.sceneName = argv[++i]; }
        else if (a == "--radio") { if (!needValue("--radio")) return ParseResult::Error; request.radioStationName = argv[++i]; }
        else if (a == "--tag") { if (!needValue("--tag")) return ParseResult::Error; request.tags.emplace_back(argv[++i]); }
        else if (a == "--date") { if (!needValue("--date")) return ParseResult::Error; request.dateText = argv[++i]; }
        else if (a == "--assets") { if (!needValue("--assets")) return ParseResult::Error; request.assetDir = argv[++i]; }
        else if (a == "--output") { if (!needValue("--output")) return ParseResult::Error; request.outputPath = argv[++i]; }
        else if (a == "--seed") {
            if (!needValue("--seed")) return ParseResult::Error;
            request.shuffleSeed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
        }
        else if (a == "--max-radio-lines") {
            if (!needValue("--max-radio-lines")) return ParseResult::Error;
            request.maxRadioLines = static_cast<std::size_t>(std::stoul(argv[++i]));
        }
        else if (a == "--policy") {
            if (!needValue("--policy")) return ParseResult::Error;
            const std::string p = argv[++i];
            if (p == "fixed") request.policy = freqcard::layout::PackingPolicy::FixedSlot;
            else if (p == "flow") request.policy = freqcard::layout::PackingPolicy::GreedyFlow;
            else { std::cerr << "Unknown policy: " << p << "\n"; return ParseResult::Error; }
        }
        else if (a == "--label") {
            if (!needValue("--label")) return ParseResult::Error;
            const std::string spec = argv[++i];
            const std::size_t colon = spec.find(':');
            freqcard::layout::LabelCategory category{};
            if (colon == std::string::npos ||
                !freqcard::layout::parseCategory(spec.substr(0, colon), category)) {
                std::cerr << "Bad --label (expected CAT:TEXT): " << spec << "\n";
                return ParseResult::Error;
            }
            request.labels.push_back(freqcard::layout::Label::make(category, spec.substr(colon + 1)));
        }
        else {
            std::cerr << "Unknown option: " << a << "\n";
            return ParseResult::Error;
        }
    }

    if (request.sceneName.empty()) {
        std::cerr << "Error: --scene NAME required\n";
        return ParseResult::Error;
    }
    return ParseResult::Run;
}

} // namespace

int main(int argc, char** argv) {
    freqcard::CardRequest request;
    try {
        const ParseResult parsed = parseArgs(argc, argv, request);
        if (parsed == ParseResult::Help) {
            printHelp(argv[0]);
            return 0;
        }
        if (parsed == ParseResult::Error) {
            printHelp(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric value (" << e.what() << ")\n";
        return 1;
    }

    try {
        freqcard::CardGenerator generator;
        const freqcard::CardOutput output = generator.generate(request);
        std::cout << "Generated: " << output.path << "\n";
        if (output.layout.tags.droppedCount > 0) {
            std::cerr << "Note: " << output.layout.tags.droppedCount
                      << " label(s) did not fit and were left out\n";
        }
    } catch (const freqcard::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    } catch (const freqcard::AssetError& e) {
        std::cerr << "Asset error: " << e.what() << "\n";
        return 3;
    }
    return 0;
}
