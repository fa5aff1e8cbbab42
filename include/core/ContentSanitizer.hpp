// © 2026 Beatrix Zselezny. All rights reserved.
// Scroll-Focus Filter

#ifndef CONTENT_SANITIZER_HPP
#define CONTENT_SANITIZER_HPP

#include <string>

namespace Scroll::Core {

    class ContentSanitizer {
    public:
        /**
         * @brief Markup tisztítás két lépésben, fix sorrendben:
         * 1. <script>...</script> blokkok (case-insensitive, soron átívelő)
         * 2. on<word>="..." / on<word>='...' attribútumok (case-sensitive,
         *    az érték nem léphet át '\n'-en; a '\r' megengedett)
         * Lineáris idejű, a bemenet méretétől függetlenül nem rekurzív.
         */
        static std::string strip(const std::string& text);
    };
}

#endif
