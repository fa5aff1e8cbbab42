// © 2026 Beatrix Zselezny. All rights reserved.
// Scroll-Focus Filter

#include "security/BackupCipher.hpp"
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <cstring>
#include <stdexcept>

namespace Scroll::Security {

    namespace {

        // OpenSSL hibasor utolsó eleme az okkal együtt
        void opensslCheck(int ok, const char* what) {
            if (ok == 1) return;
            char buf[256] = {0};
            unsigned long code = ERR_get_error();
            if (code != 0) {
                ERR_error_string_n(code, buf, sizeof(buf));
            }
            throw std::runtime_error(std::string(what) + (code != 0 ? std::string(": ") + buf : std::string()));
        }

        struct CipherCtx {
            EVP_CIPHER_CTX* p{nullptr};
            CipherCtx() : p(EVP_CIPHER_CTX_new()) {
                if (!p) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
            }
            ~CipherCtx() { EVP_CIPHER_CTX_free(p); }
            CipherCtx(const CipherCtx&) = delete;
            CipherCtx& operator=(const CipherCtx&) = delete;
        };
    }

    const std::string BackupCipher::MAGIC = "SCRL1";

    SecretKey::SecretKey() = default;

    SecretKey::~SecretKey() {
        OPENSSL_cleanse(bytes.data(), bytes.size());
    }

    SecretKey::SecretKey(SecretKey&& other) noexcept : bytes(other.bytes) {
        OPENSSL_cleanse(other.bytes.data(), other.bytes.size());
    }

    SecretKey& SecretKey::operator=(SecretKey&& other) noexcept {
        if (this != &other) {
            bytes = other.bytes;
            OPENSSL_cleanse(other.bytes.data(), other.bytes.size());
        }
        return *this;
    }

    void randomBytes(uint8_t* out, size_t len) {
        opensslCheck(RAND_bytes(out, static_cast<int>(len)), "RAND_bytes failed");
    }

    SecretKey BackupCipher::generateKey() {
        SecretKey key;
        randomBytes(key.data(), SecretKey::SIZE);
        return key;
    }

    std::vector<uint8_t> BackupCipher::seal(const std::string& plaintext, const SecretKey& key) {
        std::array<uint8_t, IV_LEN> iv{};
        randomBytes(iv.data(), iv.size());

        CipherCtx ctx;
        opensslCheck(EVP_EncryptInit_ex(ctx.p, EVP_aes_256_gcm(), nullptr, nullptr, nullptr),
                     "EncryptInit(cipher) failed");
        opensslCheck(EVP_CIPHER_CTX_ctrl(ctx.p, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(IV_LEN), nullptr),
                     "SET_IVLEN failed");
        opensslCheck(EVP_EncryptInit_ex(ctx.p, nullptr, nullptr, key.data(), iv.data()),
                     "EncryptInit(key/iv) failed");

        int tmp = 0;
        opensslCheck(EVP_EncryptUpdate(ctx.p, nullptr, &tmp,
                                       reinterpret_cast<const unsigned char*>(MAGIC.data()),
                                       static_cast<int>(MAGIC.size())),
                     "EncryptUpdate(AAD) failed");

        std::vector<uint8_t> out;
        out.reserve(MAGIC.size() + IV_LEN + plaintext.size() + TAG_LEN);
        out.insert(out.end(), MAGIC.begin(), MAGIC.end());
        out.insert(out.end(), iv.begin(), iv.end());

        size_t ctOffset = out.size();
        out.resize(ctOffset + plaintext.size() + EVP_MAX_BLOCK_LENGTH);

        int outlen = 0;
        if (!plaintext.empty()) {
            opensslCheck(EVP_EncryptUpdate(ctx.p, out.data() + ctOffset, &outlen,
                                           reinterpret_cast<const unsigned char*>(plaintext.data()),
                                           static_cast<int>(plaintext.size())),
                         "EncryptUpdate(PT) failed");
        }
        int fin = 0;
        opensslCheck(EVP_EncryptFinal_ex(ctx.p, out.data() + ctOffset + outlen, &fin),
                     "EncryptFinal failed");
        out.resize(ctOffset + static_cast<size_t>(outlen + fin));

        std::array<uint8_t, TAG_LEN> tag{};
        opensslCheck(EVP_CIPHER_CTX_ctrl(ctx.p, EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_LEN), tag.data()),
                     "GET_TAG failed");
        out.insert(out.end(), tag.begin(), tag.end());
        return out;
    }

    std::string BackupCipher::open(const std::vector<uint8_t>& packet, const SecretKey& key) {
        if (packet.size() < MAGIC.size() + IV_LEN + TAG_LEN) {
            throw std::runtime_error("Backup packet too short");
        }
        if (std::memcmp(packet.data(), MAGIC.data(), MAGIC.size()) != 0) {
            throw std::runtime_error("Bad backup packet magic");
        }

        const uint8_t* iv = packet.data() + MAGIC.size();
        const uint8_t* ct = iv + IV_LEN;
        size_t ctLen = packet.size() - MAGIC.size() - IV_LEN - TAG_LEN;
        std::array<uint8_t, TAG_LEN> tag{};
        std::memcpy(tag.data(), ct + ctLen, TAG_LEN);

        CipherCtx ctx;
        opensslCheck(EVP_DecryptInit_ex(ctx.p, EVP_aes_256_gcm(), nullptr, nullptr, nullptr),
                     "DecryptInit(cipher) failed");
        opensslCheck(EVP_CIPHER_CTX_ctrl(ctx.p, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(IV_LEN), nullptr),
                     "SET_IVLEN failed");
        opensslCheck(EVP_DecryptInit_ex(ctx.p, nullptr, nullptr, key.data(), iv),
                     "DecryptInit(key/iv) failed");

        int tmp = 0;
        opensslCheck(EVP_DecryptUpdate(ctx.p, nullptr, &tmp,
                                       reinterpret_cast<const unsigned char*>(MAGIC.data()),
                                       static_cast<int>(MAGIC.size())),
                     "DecryptUpdate(AAD) failed");

        std::string plain(ctLen + EVP_MAX_BLOCK_LENGTH, '\0');
        int outlen = 0;
        if (ctLen > 0) {
            opensslCheck(EVP_DecryptUpdate(ctx.p, reinterpret_cast<unsigned char*>(&plain[0]), &outlen,
                                           ct, static_cast<int>(ctLen)),
                         "DecryptUpdate(CT) failed");
        }
        opensslCheck(EVP_CIPHER_CTX_ctrl(ctx.p, EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_LEN), tag.data()),
                     "SET_TAG failed");

        int fin = 0;
        if (EVP_DecryptFinal_ex(ctx.p, reinterpret_cast<unsigned char*>(&plain[0]) + outlen, &fin) != 1) {
            OPENSSL_cleanse(&plain[0], plain.size());
            ERR_clear_error();
            throw std::runtime_error("Backup packet authentication failed");
        }
        plain.resize(static_cast<size_t>(outlen + fin));
        return plain;
    }
}
