// © 2026 Beatrix Zselezny. All rights reserved.
// Scroll-Focus Filter

#include "modules/FileProcessingPipeline.hpp"
#include "core/SessionIdentity.hpp"
#include "core/TraitExtractor.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/FileUtils.hpp"
#include <cerrno>
#include <exception>
#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace Scroll::Modules {

FileProcessingPipeline::FileProcessingPipeline(Scroll::Core::FilterBus& busRef,
                                               ScrollUtils::FilterConfig cfg)
    : bus(busRef),
      config(std::move(cfg)),
      sessionId(Scroll::Core::SessionIdentity::generate()),
      focusFilter(sessionId, &busRef),
      backupStore(busRef) {
}

std::string FileProcessingPipeline::getName() const {
    return "FileProcessingPipeline";
}

std::string FileProcessingPipeline::sanitizeAndFocusContext(const std::string& text) const {
    return focusFilter.sanitizeAndFocusContext(text);
}

std::string FileProcessingPipeline::process(const std::string& filePath) {
    try {
        // Az egyetlen ismert "puha" hiba: nincs ilyen fájl
        if (!inputExists(filePath)) {
            bus.metrics().missing_inputs++;
            bus.pushEvent("PIPELINE", "MISSING_INPUT: " + filePath);
            return "File " + filePath + " not found in session " + sessionId + ".";
        }
        return processExisting(filePath);
    } catch (const std::exception& e) {
        // Jelezzük, de nem nyeljük el
        bus.reportFault("PIPELINE", e.what());
        throw;
    }
}

bool FileProcessingPipeline::inputExists(const std::string& filePath) {
    std::error_code ec;
    fs::file_status st = fs::status(filePath, ec);

    if (ec) {
        const int err = ec.value();
        // Csak ezek jelentik azt, hogy "nincs ott"; minden más (pl. EACCES) hiba
        if (err == ENOENT || err == ENOTDIR || err == EBADF || err == ELOOP) {
            return false;
        }
        throw fs::filesystem_error("Cannot stat input file", filePath, ec);
    }
    return fs::is_regular_file(st);
}

std::string FileProcessingPipeline::processExisting(const std::string& filePath) {
    const std::string content = ScrollUtils::readUtf8File(filePath, config.maxInputBytes);

    // Trait a NYERS tartalmon; a fókusz-szűrő a tisztítotton újraszámolja
    const Scroll::Core::SymbolicTraits traits = Scroll::Core::extractTraits(content);

    if (traits.energy != Scroll::Core::Energy::High) {
        bus.metrics().low_energy++;
        bus.pushEvent("PIPELINE", "LOW_ENERGY: " + filePath);
        return "Buffered low-energy text from " + filePath + ". Traits: " +
               Scroll::Core::formatTraits(traits);
    }

    memory.record(ScrollTemplates::TEXT_SECTION_KEY, Scroll::Core::SectionRecord{content, traits});
    bus.pushEvent("PIPELINE", "SECTION_RECORDED: " + ScrollTemplates::TEXT_SECTION_KEY);

    const std::string focused = focusFilter.sanitizeAndFocusContext(content);

    // Ha ez elhasal, a memória-bejegyzés megmarad (nincs rollback)
    backupStore.persist(content, fs::path(filePath).stem().string(), sessionId, config.backupDir);

    return "Processed + preserved " + filePath + ": " + focused;
}

} // namespace Scroll::Modules
