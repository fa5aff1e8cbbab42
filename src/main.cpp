#include <iostream>
#include <vector>
#include <string>
#include <stdexcept>
#include "core/FilterBus.hpp"
#include "modules/FileProcessingPipeline.hpp"
#include "utils/FileUtils.hpp"
#include "utils/FilterConfig.hpp"

namespace {

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--dry-run] [--backup-dir DIR] [--mood-threshold X] [--max-bytes N] FILE..." << std::endl;
}

void printSummary(const TelemetrySnapshot& snap) {
    std::cout << "\n--- TELEMETRY ---" << std::endl;
    std::cout << "events=" << snap.total
              << " neutralized=" << snap.neutralized
              << " pruned=" << snap.pruned
              << " focused=" << snap.focused
              << " low_energy=" << snap.low_energy
              << " missing=" << snap.missing_inputs
              << " backups=" << snap.backups_written
              << " sealed_bytes=" << snap.bytes_sealed
              << " faults=" << snap.faults
              << " window_ms=" << snap.window_ms << std::endl;
}

}

int main(int argc, char* argv[]) {
    ScrollUtils::FilterConfig config;
    std::vector<std::string> inputs;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--dry-run") {
                ScrollUtils::DRY_RUN = true;
                std::cout << "\n[!] DRY-RUN MODE ACTIVATED - NO BACKUPS WILL BE WRITTEN [!]\n" << std::endl;
            } else if (arg == "--backup-dir" && i + 1 < argc) {
                config.backupDir = argv[++i];
            } else if (arg == "--mood-threshold" && i + 1 < argc) {
                config.moodThreshold = std::stod(argv[++i]);
            } else if (arg == "--max-bytes" && i + 1 < argc) {
                config.maxInputBytes = std::stoull(argv[++i]);
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "[ERROR] Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 2;
            } else {
                inputs.push_back(arg);
            }
        }
    } catch (const std::logic_error& e) {
        // std::stod / std::stoull: invalid_argument, out_of_range
        std::cerr << "[ERROR] Bad numeric argument: " << e.what() << std::endl;
        return 2;
    }

    if (inputs.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    Scroll::Core::FilterBus bus;

    // A konzol a mag szempontjából csak egy előfizető
    bus.events().subscribe([](const Scroll::Core::FilterEvent& e) {
        std::cout << "[" << e.source << "] " << e.payload << std::endl;
    });

    try {
        Scroll::Modules::FileProcessingPipeline pipeline(bus, config);
        std::cout << "--- SCROLL-FOCUS FILTER - SESSION " << pipeline.getSessionId() << " ---" << std::endl;

        for (const auto& path : inputs) {
            std::cout << pipeline.process(path) << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        printSummary(bus.getTelemetrySnapshot());
        return 1;
    }

    printSummary(bus.getTelemetrySnapshot());
    return 0;
}
