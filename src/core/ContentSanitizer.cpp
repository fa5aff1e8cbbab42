// © 2026 Beatrix Zselezny. All rights reserved.
// Scroll-Focus Filter

#include "core/ContentSanitizer.hpp"
#include "utils/ConfigTemplates.hpp"
#include "utils/StringUtils.hpp"
#include <cctype>

namespace Scroll::Core {

    namespace {

        bool isWordChar(char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        }

        bool isQuote(char c) {
            return c == '"' || c == '\'';
        }

        // <script ... </script> blokkok, legrövidebb illesztés, soron átívelő.
        // Lineáris keresés: hosszú blokkoknál sincs rekurzió.
        std::string stripScriptBlocks(const std::string& text) {
            const std::string& openTag = ScrollTemplates::SCRIPT_OPEN_TAG;
            const std::string& closeTag = ScrollTemplates::SCRIPT_CLOSE_TAG;
            const std::string lowered = ScrollUtils::toLower(text);

            std::string out;
            out.reserve(text.size());

            size_t pos = 0;
            while (pos < text.size()) {
                size_t open = lowered.find(openTag, pos);
                if (open == std::string::npos) break;

                size_t close = lowered.find(closeTag, open + openTag.size());
                // Nincs lezárás: a későbbi nyitó tagek sem zárulhatnak le
                if (close == std::string::npos) break;

                out.append(text, pos, open - pos);
                pos = close + closeTag.size();
            }
            out.append(text, pos, std::string::npos);
            return out;
        }

        /**
         * @brief on<word>=<quote>...<quote> hossza az adott pozíción, vagy 0.
         * Az érték bármelyik idézőjelig tart, sortörésen nem léphet át.
         * Sikertelen illesztésnél @p resume az első pozíció, ahonnan újabb
         * illesztés egyáltalán lehetséges (a bejárt szófutamon és értéken
         * belüli "on" kezdetek ugyanígy buknának el).
         */
        size_t handlerLengthAt(const std::string& text, size_t i, size_t& resume) {
            const std::string& prefix = ScrollTemplates::EVENT_HANDLER_PREFIX;
            resume = i + 1;
            if (text.compare(i, prefix.size(), prefix) != 0) return 0;

            size_t j = i + prefix.size();
            size_t nameStart = j;
            while (j < text.size() && isWordChar(text[j])) ++j;
            if (j == nameStart) return 0;
            resume = j;

            if (j >= text.size() || text[j] != '=') return 0;
            ++j;
            if (j >= text.size() || !isQuote(text[j])) return 0;
            ++j;

            for (; j < text.size(); ++j) {
                if (text[j] == '\n') {
                    resume = j;
                    return 0;
                }
                if (isQuote(text[j])) return j + 1 - i;
            }
            resume = j;
            return 0;
        }

        std::string stripEventHandlers(const std::string& text) {
            std::string out;
            out.reserve(text.size());

            size_t i = 0;
            while (i < text.size()) {
                size_t resume = i + 1;
                size_t len = handlerLengthAt(text, i, resume);
                if (len > 0) {
                    i += len;
                } else {
                    out.append(text, i, resume - i);
                    i = resume;
                }
            }
            return out;
        }
    }

    std::string ContentSanitizer::strip(const std::string& text) {
        return stripEventHandlers(stripScriptBlocks(text));
    }
}
