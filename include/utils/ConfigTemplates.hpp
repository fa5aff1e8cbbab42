#ifndef CONFIGTEMPLATES_HPP
#define CONFIGTEMPLATES_HPP

#include <vector>
#include <string>

namespace ScrollTemplates {

    /**
     * @brief Egy injekciós szignatúra: név + ECMAScript minta.
     * Minden minta kis-nagybetű érzéketlenül fut, nem horgonyzott kereséssel.
     */
    struct SignatureTemplate {
        std::string name;
        std::string pattern;
    };

    // Prompt-injekció szignatúrák (a sorrend számít: az első találat nyer)
    extern const std::vector<SignatureTemplate> INJECTION_SIGNATURES;

    // Jóváhagyott fókusz-szókincs
    extern const std::vector<std::string> FOCUS_VOCABULARY;

    // Szanitizáló jelölők (kisbetűs nyitó/záró tag, case-sensitive handler előtag)
    extern const std::string SCRIPT_OPEN_TAG;
    extern const std::string SCRIPT_CLOSE_TAG;
    extern const std::string EVENT_HANDLER_PREFIX;

    // Trait kulcsszavak
    extern const std::string CHAOTIC_KEYWORD;
    extern const std::string ENERGETIC_KEYWORD;

    // Perzisztencia
    extern const std::string DEFAULT_BACKUP_DIR;
    extern const std::string BACKUP_EXTENSION;
    extern const std::string TEXT_SECTION_KEY;
}

#endif
