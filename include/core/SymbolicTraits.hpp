#pragma once

#include <string>

namespace Scroll::Core {

enum class Energy {
    Neutral,
    High
};

enum class Ethics {
    Grounded,
    Chaotic
};

struct SymbolicTraits {
    Energy energy = Energy::Neutral;
    Ethics ethics = Ethics::Grounded;

    bool operator==(const SymbolicTraits& o) const { return energy == o.energy && ethics == o.ethics; }
    bool operator!=(const SymbolicTraits& o) const { return !(*this == o); }
};

const char* toString(Energy e);
const char* toString(Ethics e);

// "{energy: high, ethics: chaotic}"
std::string formatTraits(const SymbolicTraits& traits);

} // namespace Scroll::Core
