#include "utils/StringUtils.hpp"
#include <cctype>
#include <sstream>
#include <iomanip>

namespace ScrollUtils {
    std::string toLower(std::string s) {
        for (auto& c : s) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return s;
    }

    std::vector<std::string> splitWhitespace(const std::string& s) {
        std::vector<std::string> tokens;
        std::istringstream iss(s);
        std::string token;
        while (iss >> token) {
            tokens.push_back(token);
        }
        return tokens;
    }

    std::string join(const std::vector<std::string>& parts, const std::string& sep) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) out += sep;
            out += parts[i];
        }
        return out;
    }

    std::string toHex(const uint8_t* data, size_t len) {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (size_t i = 0; i < len; ++i) {
            oss << std::setw(2) << static_cast<int>(data[i]);
        }
        return oss.str();
    }

    std::string normalizeNewlines(const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '\r') {
                out.push_back('\n');
                if (i + 1 < s.size() && s[i + 1] == '\n') ++i;
            } else {
                out.push_back(s[i]);
            }
        }
        return out;
    }

    size_t findInvalidUtf8(const std::string& s) {
        size_t i = 0;
        const size_t n = s.size();
        while (i < n) {
            unsigned char c = static_cast<unsigned char>(s[i]);
            if (c < 0x80) { ++i; continue; }

            size_t len;
            uint32_t cp;
            if ((c & 0xE0) == 0xC0)      { len = 2; cp = c & 0x1F; }
            else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
            else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
            else return i;

            if (i + len > n) return i;
            for (size_t k = 1; k < len; ++k) {
                unsigned char cc = static_cast<unsigned char>(s[i + k]);
                if ((cc & 0xC0) != 0x80) return i;
                cp = (cp << 6) | (cc & 0x3F);
            }

            // Overlong, surrogate és tartományon kívüli kódpontok
            if ((len == 2 && cp < 0x80) ||
                (len == 3 && cp < 0x800) ||
                (len == 4 && cp < 0x10000) ||
                (cp >= 0xD800 && cp <= 0xDFFF) ||
                cp > 0x10FFFF) {
                return i;
            }
            i += len;
        }
        return std::string::npos;
    }
}
