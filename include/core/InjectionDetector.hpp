// © 2026 Beatrix Zselezny. All rights reserved.
// Scroll-Focus Filter
// Prompt-Injection Signature Probe

#ifndef INJECTION_DETECTOR_HPP
#define INJECTION_DETECTOR_HPP

#include <string>

namespace Scroll::Core {

    /**
     * @brief Könnyűsúlyú szignatúra-szonda.
     * Nem normalizál (a kis-nagybetű érzéketlenségen túl), nincs mellékhatása.
     */
    class InjectionDetector {
    public:
        /**
         * @brief Van-e bármely szignatúra a szövegben (nem horgonyzott keresés).
         * @param text A vizsgálandó nyers szöveg.
         * @return true az első találatnál.
         */
        static bool detect(const std::string& text);

        /**
         * @brief Az első illeszkedő szignatúra neve diagnosztikához.
         * @return Üres string, ha nincs találat.
         */
        static std::string matchedSignature(const std::string& text);
    };

} // namespace Scroll::Core

#endif // INJECTION_DETECTOR_HPP
