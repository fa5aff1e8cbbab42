#include "security/SignatureRegistry.hpp"
#include "utils/ConfigTemplates.hpp"

namespace Scroll::Security {

const SignatureRegistry& SignatureRegistry::instance() {
    static const SignatureRegistry inst;
    return inst;
}

SignatureRegistry::SignatureRegistry() {
    table.reserve(ScrollTemplates::INJECTION_SIGNATURES.size());
    for (const auto& sig : ScrollTemplates::INJECTION_SIGNATURES) {
        table.push_back(CompiledSignature{
            sig.name,
            std::regex(sig.pattern, std::regex::ECMAScript | std::regex::icase | std::regex::optimize)
        });
    }
}

const CompiledSignature* SignatureRegistry::firstMatch(const std::string& text) const {
    for (const auto& sig : table) {
        if (std::regex_search(text, sig.pattern)) {
            return &sig;
        }
    }
    return nullptr;
}

} // namespace Scroll::Security
