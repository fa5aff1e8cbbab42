// © 2026 Beatrix Zselezny. All rights reserved.
// Scroll-Focus Filter

#include "telemetry/FilterTelemetry.hpp"

FilterTelemetry::FilterTelemetry()
    : window_start(std::chrono::steady_clock::now())
{
}

void FilterTelemetry::reset_window() {
    window_start = std::chrono::steady_clock::now();
}

void FilterTelemetry::record_outcome(FocusOutcome outcome) {
    switch (outcome) {
        case FocusOutcome::NEUTRALIZED: neutralized++; break;
        case FocusOutcome::PRUNED:      pruned++;      break;
        case FocusOutcome::FOCUSED:     focused++;     break;
    }
}

TelemetrySnapshot FilterTelemetry::snapshot() const {
    TelemetrySnapshot snap{};

    snap.total = total_events.load();

    snap.neutralized = neutralized.load();
    snap.pruned      = pruned.load();
    snap.focused     = focused.load();

    snap.low_energy      = low_energy.load();
    snap.missing_inputs  = missing_inputs.load();
    snap.backups_written = backups_written.load();
    snap.bytes_sealed    = bytes_sealed.load();
    snap.faults          = faults.load();

    snap.state = state.load();

    snap.window_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - window_start
        ).count();

    return snap;
}
