// © 2026 Beatrix Zselezny. All rights reserved.
// Scroll-Focus Filter

#include "core/FilterBus.hpp"

namespace Scroll::Core {

    FilterBus::FilterBus() {
        telemetry.reset_window();
    }

    FilterBus::~FilterBus() {
        diag_bus.get_subscriber().on_completed();
    }

    void FilterBus::pushEvent(const std::string& source, const std::string& payload) {
        telemetry.total_events++;
        diag_bus.get_subscriber().on_next(FilterEvent{source, payload});
    }

    void FilterBus::reportFault(const std::string& source, const std::string& what) {
        telemetry.record_fault();
        pushEvent(source, "FAULT: " + what);
    }

    rxcpp::observable<FilterEvent> FilterBus::events() const {
        return diag_bus.get_observable();
    }

    TelemetrySnapshot FilterBus::getTelemetrySnapshot() const {
        return telemetry.snapshot();
    }

} // namespace Scroll::Core
