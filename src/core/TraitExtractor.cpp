#include "core/TraitExtractor.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/StringUtils.hpp"

namespace Scroll::Core {

const char* toString(Energy e) {
    switch (e) {
        case Energy::High:    return "high";
        case Energy::Neutral: return "neutral";
    }
    return "neutral";
}

const char* toString(Ethics e) {
    switch (e) {
        case Ethics::Chaotic:  return "chaotic";
        case Ethics::Grounded: return "grounded";
    }
    return "grounded";
}

std::string formatTraits(const SymbolicTraits& traits) {
    return std::string("{energy: ") + toString(traits.energy) +
           ", ethics: " + toString(traits.ethics) + "}";
}

SymbolicTraits extractTraits(const std::string& text) {
    SymbolicTraits result;
    const std::string lowered = ScrollUtils::toLower(text);

    if (lowered.find(ScrollTemplates::CHAOTIC_KEYWORD) != std::string::npos)
        result.ethics = Ethics::Chaotic;

    if (lowered.find(ScrollTemplates::ENERGETIC_KEYWORD) != std::string::npos)
        result.energy = Energy::High;

    return result;
}

} // namespace Scroll::Core
