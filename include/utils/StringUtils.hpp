#ifndef STRINGUTILS_HPP
#define STRINGUTILS_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace ScrollUtils {
    /**
     * @brief ASCII kisbetűsítés (a kulcsszó-tesztekhez elég).
     */
    std::string toLower(std::string s);

    /**
     * @brief Whitespace mentén darabol, az üres tokeneket eldobja.
     */
    std::vector<std::string> splitWhitespace(const std::string& s);

    std::string join(const std::vector<std::string>& parts, const std::string& sep);

    /**
     * @brief Bájtok kisbetűs hexa alakja (2 karakter / bájt).
     */
    std::string toHex(const uint8_t* data, size_t len);

    /**
     * @brief Univerzális sortörés: "\r\n" és magányos "\r" -> "\n" (szöveg módú olvasás).
     */
    std::string normalizeNewlines(const std::string& s);

    /**
     * @brief Szigorú UTF-8 validáció (overlong, surrogate, > U+10FFFF tiltva).
     * @return A hibás szekvencia offsetje, vagy std::string::npos ha érvényes.
     */
    size_t findInvalidUtf8(const std::string& s);
}

#endif
