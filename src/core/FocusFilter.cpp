// © 2026 Beatrix Zselezny. All rights reserved.
// Scroll-Focus Filter

#include "core/FocusFilter.hpp"
#include "core/ContentSanitizer.hpp"
#include "core/FilterBus.hpp"
#include "core/InjectionDetector.hpp"
#include "core/TraitExtractor.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/StringUtils.hpp"
#include <algorithm>
#include <utility>

namespace Scroll::Core {

    FocusFilter::FocusFilter(std::string sessionId, FilterBus* busPtr)
        : session(std::move(sessionId)), bus(busPtr) {
    }

    std::vector<std::string> FocusFilter::focusTokens(const std::string& sanitized) {
        const auto& vocab = ScrollTemplates::FOCUS_VOCABULARY;
        std::vector<std::string> kept;

        for (const auto& token : ScrollUtils::splitWhitespace(sanitized)) {
            if (std::find(vocab.begin(), vocab.end(), ScrollUtils::toLower(token)) != vocab.end()) {
                kept.push_back(token);
            }
        }
        return kept;
    }

    FocusResult FocusFilter::focus(const std::string& text) const {
        FocusResult result;

        // 1. Injekció: kemény rövidzár
        std::string signature = InjectionDetector::matchedSignature(text);
        if (!signature.empty()) {
            result.outcome = FocusOutcome::NEUTRALIZED;
            result.message = "Suspicious input in session " + session + ". Context neutralized.";
            if (bus) {
                bus->metrics().record_outcome(result.outcome);
                bus->pushEvent("FOCUS", "NEUTRALIZED: signature=" + signature);
            }
            return result;
        }

        // 2-3. Tisztítás, majd trait a tisztított szövegen
        const std::string sanitized = ContentSanitizer::strip(text);
        result.traits = extractTraits(sanitized);

        // 4. Chaotic -> pruned, fókusz nélkül
        if (result.traits.ethics == Ethics::Chaotic) {
            result.outcome = FocusOutcome::PRUNED;
            result.message = "Pruned context in " + session + " for symbiosis. Traits: " +
                             formatTraits(result.traits);
            if (bus) {
                bus->metrics().record_outcome(result.outcome);
                bus->pushEvent("FOCUS", "PRUNED: " + formatTraits(result.traits));
            }
            return result;
        }

        // 5. Fókusz-redukció
        result.outcome = FocusOutcome::FOCUSED;
        result.focused = ScrollUtils::join(focusTokens(sanitized), " ");
        result.message = "Focused context in " + session + ": " + result.focused +
                         ". Traits: " + formatTraits(result.traits);
        if (bus) {
            bus->metrics().record_outcome(result.outcome);
            bus->pushEvent("FOCUS", "FOCUSED: tokens=\"" + result.focused + "\"");
        }
        return result;
    }

    std::string FocusFilter::sanitizeAndFocusContext(const std::string& text) const {
        return focus(text).message;
    }
}
