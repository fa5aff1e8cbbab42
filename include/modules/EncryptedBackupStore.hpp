// © 2026 Beatrix Zselezny. All rights reserved.
// Scroll-Focus Filter

#ifndef ENCRYPTED_BACKUP_STORE_HPP
#define ENCRYPTED_BACKUP_STORE_HPP

#include "core/FilterBus.hpp"
#include <string>

namespace Scroll::Modules {

    /**
     * @brief "Burn after writing" mentés.
     *
     * Minden hívás friss kulcsot generál, a nyers tartalmat AES-256-GCM-mel
     * lezárja, és a <backupDir>/<stem>_<session>.enc fájlba írja. A kulcs
     * a hívás végén kinullázódik: nem kerül lemezre és nem kapja meg a hívó,
     * így a mentés ebből a folyamatból nem fejthető vissza.
     */
    class EncryptedBackupStore {
    public:
        // Dependency Injection: a BACKUP események a buszra mennek
        explicit EncryptedBackupStore(Scroll::Core::FilterBus& busRef);

        /**
         * @return A mentés útvonala.
         * @throws std::system_error / std::filesystem::filesystem_error I/O hibánál
         * @throws std::runtime_error OpenSSL hibánál
         */
        std::string persist(const std::string& rawContent,
                            const std::string& fileStem,
                            const std::string& sessionId,
                            const std::string& backupDir);

        static std::string backupPathFor(const std::string& backupDir,
                                         const std::string& fileStem,
                                         const std::string& sessionId);

    private:
        Scroll::Core::FilterBus& bus;
    };

}

#endif
