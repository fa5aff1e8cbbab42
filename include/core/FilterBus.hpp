// © 2026 Beatrix Zselezny. All rights reserved.
// Scroll-Focus Filter

#ifndef SCROLL_FILTER_BUS_HPP
#define SCROLL_FILTER_BUS_HPP

#include <string>
#include "rxcpp/rx.hpp"

// Telemetria és Típusok
#include "telemetry/FilterTelemetry.hpp"

namespace Scroll::Core {

    /**
     * @brief Diagnosztikai esemény a buszon.
     * source: a kibocsátó komponens (FOCUS, PIPELINE, BACKUP)
     * payload: "KIND: részletek"
     */
    struct FilterEvent {
        std::string source;
        std::string payload;
    };

    /**
     * @brief Diagnosztikai busz: a mag soha nem ír konzolra, csak ide.
     * Szinkron (current thread), egy szálról használandó.
     */
    class FilterBus {
    private:
        rxcpp::subjects::subject<FilterEvent> diag_bus;

        // --- Telemetry ---
        FilterTelemetry telemetry;

    public:
        FilterBus();
        ~FilterBus();

        FilterBus(const FilterBus&) = delete;
        FilterBus& operator=(const FilterBus&) = delete;

        // --- Public API (Publishing) ---
        void pushEvent(const std::string& source, const std::string& payload);

        // Fatális hiba jelzése; a hívó ezután továbbdobja a kivételt
        void reportFault(const std::string& source, const std::string& what);

        // --- Subscription ---
        rxcpp::observable<FilterEvent> events() const;

        // --- Diagnostics ---
        FilterTelemetry& metrics() { return telemetry; }
        [[nodiscard]] TelemetrySnapshot getTelemetrySnapshot() const;
    };
}

#endif
