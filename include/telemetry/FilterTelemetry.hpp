#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "telemetry/TelemetryTypes.hpp"
#include "telemetry/TelemetrySnapshot.hpp"

struct FilterTelemetry {
    // Event counters
    std::atomic<uint64_t> total_events{0};

    // Focus outcomes
    std::atomic<uint64_t> neutralized{0};
    std::atomic<uint64_t> pruned{0};
    std::atomic<uint64_t> focused{0};

    // Pipeline
    std::atomic<uint64_t> low_energy{0};
    std::atomic<uint64_t> missing_inputs{0};
    std::atomic<uint64_t> backups_written{0};
    std::atomic<uint64_t> bytes_sealed{0};
    std::atomic<uint64_t> faults{0};

    // Bus state
    std::atomic<BusState> state{BusState::UP};

    // Time window
    std::chrono::steady_clock::time_point window_start;

    void record_outcome(FocusOutcome outcome);
    void record_fault() { faults++; state.store(BusState::DEGRADED); }

    FilterTelemetry();
    [[nodiscard]] TelemetrySnapshot snapshot() const;
    void reset_window();
};
