// © 2026 Beatrix Zselezny. All rights reserved.
// Scroll-Focus Filter

#include "modules/EncryptedBackupStore.hpp"
#include "security/BackupCipher.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/FileUtils.hpp"
#include <filesystem>

namespace fs = std::filesystem;

namespace Scroll::Modules {

EncryptedBackupStore::EncryptedBackupStore(Scroll::Core::FilterBus& busRef)
    : bus(busRef) {
}

std::string EncryptedBackupStore::backupPathFor(const std::string& backupDir,
                                                const std::string& fileStem,
                                                const std::string& sessionId) {
    fs::path p = fs::path(backupDir) / (fileStem + "_" + sessionId + ScrollTemplates::BACKUP_EXTENSION);
    return p.string();
}

std::string EncryptedBackupStore::persist(const std::string& rawContent,
                                          const std::string& fileStem,
                                          const std::string& sessionId,
                                          const std::string& backupDir) {
    const std::string path = backupPathFor(backupDir, fileStem, sessionId);

    std::vector<uint8_t> packet;
    {
        // A kulcs ebben a blokkban él, a SecretKey destruktora kinullázza
        Security::SecretKey key = Security::BackupCipher::generateKey();
        packet = Security::BackupCipher::seal(rawContent, key);
    }
    bus.metrics().bytes_sealed += rawContent.size();

    if (ScrollUtils::DRY_RUN) {
        bus.pushEvent("BACKUP", "DRY_RUN: would write " + std::to_string(packet.size()) + " bytes to " + path);
        return path;
    }

    ScrollUtils::ensurePrivateDirectory(backupDir);
    ScrollUtils::writeSealedFile(path, packet);

    bus.metrics().backups_written++;
    bus.pushEvent("BACKUP", "PRESERVED: " + path);
    return path;
}

} // namespace Scroll::Modules
