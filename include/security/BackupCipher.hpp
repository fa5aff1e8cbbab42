// © 2026 Beatrix Zselezny. All rights reserved.
// Scroll-Focus Filter

#ifndef SCROLL_BACKUP_CIPHER_HPP
#define SCROLL_BACKUP_CIPHER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Scroll::Security {

    /**
     * @brief 256 bites szimmetrikus kulcs, ami megsemmisüléskor kinullázza magát.
     * Nem másolható, csak mozgatható.
     */
    class SecretKey {
    public:
        static constexpr size_t SIZE = 32;

        SecretKey();
        ~SecretKey();

        SecretKey(const SecretKey&) = delete;
        SecretKey& operator=(const SecretKey&) = delete;
        SecretKey(SecretKey&& other) noexcept;
        SecretKey& operator=(SecretKey&& other) noexcept;

        uint8_t* data() { return bytes.data(); }
        const uint8_t* data() const { return bytes.data(); }

    private:
        std::array<uint8_t, SIZE> bytes{};
    };

    /**
     * @brief AES-256-GCM csomagolás a mentésekhez.
     *
     * Csomag formátum:
     *   MAGIC ("SCRL1", 5 bájt, AAD-ként hitelesítve)
     *   | IV (12 bájt, véletlen)
     *   | ciphertext (= plaintext hossza)
     *   | GCM tag (16 bájt)
     */
    class BackupCipher {
    public:
        static constexpr size_t IV_LEN = 12;
        static constexpr size_t TAG_LEN = 16;
        static const std::string MAGIC;

        // Friss, egyenletes eloszlású kulcs (RAND_bytes)
        static SecretKey generateKey();

        // @throws std::runtime_error bármely OpenSSL hibánál
        static std::vector<uint8_t> seal(const std::string& plaintext, const SecretKey& key);

        /**
         * @brief Csomag visszafejtése ismert kulccsal (formátum-ellenőrzéshez).
         * @throws std::runtime_error rossz magic, rövid csomag vagy tag-hiba esetén
         */
        static std::string open(const std::vector<uint8_t>& packet, const SecretKey& key);
    };

    // Véletlen bájtok az OpenSSL CSPRNG-ből. @throws std::runtime_error
    void randomBytes(uint8_t* out, size_t len);
}

#endif
