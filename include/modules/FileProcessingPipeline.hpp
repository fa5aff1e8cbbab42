// © 2026 Beatrix Zselezny. All rights reserved.
// Scroll-Focus Filter

#ifndef FILE_PROCESSING_PIPELINE_HPP
#define FILE_PROCESSING_PIPELINE_HPP

#include "core/FilterBus.hpp"
#include "core/FocusFilter.hpp"
#include "core/SymbolicMemory.hpp"
#include "modules/EncryptedBackupStore.hpp"
#include "utils/FilterConfig.hpp"
#include <string>

namespace Scroll::Modules {

    /**
     * @brief Egy szűrő-példány: session identitás, szekció-memória, mentés.
     *
     * Szinkron és blokkoló. NEM szálbiztos: egy példányt (és a buszát)
     * egyetlen szálról szabad használni.
     */
    class FileProcessingPipeline {
    public:
        // Dependency Injection: Kötelező a Bus megadása
        explicit FileProcessingPipeline(Scroll::Core::FilterBus& busRef,
                                        ScrollUtils::FilterConfig cfg = ScrollUtils::FilterConfig{});

        std::string getName() const;

        /**
         * @brief Egy bemeneti fájl teljes feldolgozása.
         * Hiányzó fájl: státusz-sor, nincs kivétel. Minden más hiba továbbmegy.
         */
        std::string process(const std::string& filePath);

        // Állapotmentes szűrés ezen a sessionön
        std::string sanitizeAndFocusContext(const std::string& text) const;

        const std::string& getSessionId() const { return sessionId; }
        double getMoodThreshold() const { return config.moodThreshold; }
        const std::string& getBackupDir() const { return config.backupDir; }
        const Scroll::Core::SymbolicMemory& getMemory() const { return memory; }

    private:
        Scroll::Core::FilterBus& bus;
        const ScrollUtils::FilterConfig config;
        const std::string sessionId;

        Scroll::Core::SymbolicMemory memory;
        Scroll::Core::FocusFilter focusFilter;
        EncryptedBackupStore backupStore;

        std::string processExisting(const std::string& filePath);

        // Nem létező bemenet: false. Egyéb stat hiba: @throws std::filesystem::filesystem_error
        static bool inputExists(const std::string& filePath);
    };

}

#endif
