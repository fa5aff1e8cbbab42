// © 2026 Beatrix Zselezny. All rights reserved.
// Scroll-Focus Filter

#ifndef SCROLL_FOCUS_FILTER_HPP
#define SCROLL_FOCUS_FILTER_HPP

#include <string>
#include <vector>

#include "core/SymbolicTraits.hpp"
#include "telemetry/TelemetryTypes.hpp"

namespace Scroll::Core {

    class FilterBus;

    struct FocusResult {
        FocusOutcome outcome = FocusOutcome::NEUTRALIZED;

        // NEUTRALIZED esetén nincs kiszámolva (alapértékek maradnak)
        SymbolicTraits traits;

        // Csak FOCUSED ágon töltődik
        std::string focused;

        std::string message;
    };

    /**
     * @brief Injekció -> szanitizálás -> trait -> fókusz-redukció.
     *
     * Rövidzárak: injekció gyanúnál semmi más nem fut; chaotic etikánál
     * a fókusz-redukció marad ki. Állapotmentes, csak a session id-t
     * és az opcionális buszt tartja.
     */
    class FocusFilter {
    public:
        explicit FocusFilter(std::string sessionId, FilterBus* bus = nullptr);

        FocusResult focus(const std::string& text) const;

        // Emberi olvasásra szánt státusz-sor
        std::string sanitizeAndFocusContext(const std::string& text) const;

        /**
         * @brief A jóváhagyott szókincsbe eső tokenek, eredeti sorrendben, duplikátumokkal.
         */
        static std::vector<std::string> focusTokens(const std::string& sanitized);

        const std::string& sessionId() const { return session; }

    private:
        std::string session;
        FilterBus* bus;
    };
}

#endif
