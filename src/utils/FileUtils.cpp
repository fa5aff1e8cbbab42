#include "utils/FileUtils.hpp"
#include "utils/StringUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <cerrno>

namespace fs = std::filesystem;

namespace ScrollUtils {

    // Globális flag a biztonságos teszteléshez
    bool DRY_RUN = false;

    void ensurePrivateDirectory(const std::string& dir) {
        if (fs::exists(dir)) return;

        fs::create_directories(dir);
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace);
    }

    void writeSealedFile(const std::string& path, const std::vector<uint8_t>& bytes) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::system_error(errno, std::generic_category(), "Cannot open backup file: " + path);
        }

        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file) {
            throw std::system_error(errno, std::generic_category(), "Backup write failed: " + path);
        }
    }

    std::string readUtf8File(const std::string& path, std::size_t maxBytes) {
        if (maxBytes > 0) {
            auto size = fs::file_size(path);
            if (size > maxBytes) {
                throw std::runtime_error("Input exceeds " + std::to_string(maxBytes) + " bytes: " + path);
            }
        }

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw std::system_error(errno, std::generic_category(), "Cannot open input file: " + path);
        }

        std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
            throw std::system_error(errno, std::generic_category(), "Input read failed: " + path);
        }

        size_t bad = findInvalidUtf8(content);
        if (bad != std::string::npos) {
            throw std::runtime_error("Invalid UTF-8 at byte " + std::to_string(bad) + " in " + path);
        }
        return normalizeNewlines(content);
    }
}
