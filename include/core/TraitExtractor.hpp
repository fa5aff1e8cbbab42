#pragma once

#include <string>
#include "core/SymbolicTraits.hpp"

namespace Scroll::Core {

/**
 * @brief Kulcsszó-alapú hangulat/etika címkézés.
 * Két független részsztring-teszt (nincs szóhatár-figyelés), mindkettő elsülhet.
 */
SymbolicTraits extractTraits(const std::string& text);

} // namespace Scroll::Core
