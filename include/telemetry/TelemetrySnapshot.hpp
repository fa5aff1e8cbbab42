#pragma once

#include <cstdint>
#include "telemetry/TelemetryTypes.hpp"

struct TelemetrySnapshot {
    // --- Bus Traffic ---
    uint64_t total;

    // --- Focus Outcomes ---
    uint64_t neutralized;
    uint64_t pruned;
    uint64_t focused;

    // --- Pipeline ---
    uint64_t low_energy;
    uint64_t missing_inputs;
    uint64_t backups_written;
    uint64_t bytes_sealed;
    uint64_t faults;

    // --- Health ---
    BusState state;
    uint64_t window_ms;
};
