#pragma once

#include <regex>
#include <string>
#include <vector>

namespace Scroll::Security {

struct CompiledSignature {
    std::string name;
    std::regex pattern;
};

/**
 * @brief Processz-szintű, megváltoztathatatlan szignatúra-tábla.
 * Az első instance() hívás fordítja le a ScrollTemplates mintáit, utána csak olvasható.
 */
class SignatureRegistry {
public:
    static const SignatureRegistry& instance();

    // Az első illeszkedő szignatúra, vagy nullptr
    const CompiledSignature* firstMatch(const std::string& text) const;

    const std::vector<CompiledSignature>& signatures() const { return table; }

private:
    SignatureRegistry();

    std::vector<CompiledSignature> table;
};

}
