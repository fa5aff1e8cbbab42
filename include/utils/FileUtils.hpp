#ifndef FILEUTILS_HPP
#define FILEUTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace ScrollUtils {
    // DRY_RUN flag: titkosítunk, de nem írunk lemezre
    extern bool DRY_RUN;

    /**
     * @brief Létrehozza a könyvtárat, ha hiányzik (idempotens).
     * Újonnan létrehozott könyvtár szigorú (0700) jogosultságot kap.
     * @throws std::filesystem::filesystem_error
     */
    void ensurePrivateDirectory(const std::string& dir);

    /**
     * @brief Bináris csomag kiírása (truncate). Hiba esetén kivételt dob errno-val.
     * @throws std::system_error
     */
    void writeSealedFile(const std::string& path, const std::vector<uint8_t>& bytes);

    /**
     * @brief Teljes fájl beolvasása UTF-8 szövegként, sortörések "\n"-re egységesítve.
     * @param maxBytes 0 esetén nincs korlát.
     * @throws std::system_error olvasási hiba esetén
     * @throws std::runtime_error érvénytelen UTF-8 vagy túl nagy bemenet esetén
     */
    std::string readUtf8File(const std::string& path, std::size_t maxBytes);
}

#endif
