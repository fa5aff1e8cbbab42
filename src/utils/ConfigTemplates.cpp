#include "utils/ConfigTemplates.hpp"

namespace ScrollTemplates {

    const std::vector<SignatureTemplate> INJECTION_SIGNATURES = {
        { "ignore-previous", "ignore previous instructions" },
        { "system-prompt",   "system prompt" },
        { "forget-all",      "forget everything" },
        { "output-as-code",  "output as code" },
        { "reveal-secret",   "reveal secret" },
        { "inject-token",    "[\\[\\(]inject[\\]\\)]" },
        { "base64",          "base64" },
        { "url",             "https?://" }
    };

    const std::vector<std::string> FOCUS_VOCABULARY = {
        "symbiosis",
        "compression",
        "truth"
    };

    const std::string SCRIPT_OPEN_TAG      = "<script";
    const std::string SCRIPT_CLOSE_TAG     = "</script>";
    const std::string EVENT_HANDLER_PREFIX = "on";

    const std::string CHAOTIC_KEYWORD   = "chaotic";
    const std::string ENERGETIC_KEYWORD = "energetic";

    const std::string DEFAULT_BACKUP_DIR = "private_logs";
    const std::string BACKUP_EXTENSION   = ".enc";
    const std::string TEXT_SECTION_KEY   = "text_section";
}
