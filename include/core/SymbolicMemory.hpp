#ifndef SYMBOLIC_MEMORY_HPP
#define SYMBOLIC_MEMORY_HPP

#include <map>
#include <optional>
#include <string>
#include <cstddef>

#include "core/SymbolicTraits.hpp"

namespace Scroll::Core {

struct SectionRecord {
    std::string content;
    SymbolicTraits traits;
};

/**
 * @brief Session-szintű szekció-memória.
 * Csak nő (nincs eviction), azonos kulcsra az utolsó írás nyer.
 * Nem szálbiztos: a tulajdonos pipeline szálához kötött.
 */
class SymbolicMemory {
private:
    std::map<std::string, SectionRecord> sections;

public:
    SymbolicMemory() = default;
    ~SymbolicMemory() = default;

    void record(const std::string& section, SectionRecord rec);
    std::optional<SectionRecord> find(const std::string& section) const;

    bool contains(const std::string& section) const { return sections.count(section) > 0; }
    size_t size() const { return sections.size(); }
};

} // namespace Scroll::Core

#endif
