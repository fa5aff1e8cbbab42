#include "core/SymbolicMemory.hpp"
#include <utility>

namespace Scroll::Core {

void SymbolicMemory::record(const std::string& section, SectionRecord rec) {
    sections[section] = std::move(rec);
}

std::optional<SectionRecord> SymbolicMemory::find(const std::string& section) const {
    auto it = sections.find(section);
    if (it == sections.end()) return std::nullopt;
    return it->second;
}

}
