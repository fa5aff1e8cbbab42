// © 2026 Beatrix Zselezny. All rights reserved.
// Scroll-Focus Filter

#include "core/InjectionDetector.hpp"
#include "security/SignatureRegistry.hpp"

namespace Scroll::Core {

    bool InjectionDetector::detect(const std::string& text) {
        return Security::SignatureRegistry::instance().firstMatch(text) != nullptr;
    }

    std::string InjectionDetector::matchedSignature(const std::string& text) {
        const auto* sig = Security::SignatureRegistry::instance().firstMatch(text);
        return sig ? sig->name : std::string();
    }

} // namespace Scroll::Core
