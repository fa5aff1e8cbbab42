#pragma once

#include <cstddef>
#include <string>

namespace Scroll::Core {

class SessionIdentity {
public:
    static constexpr size_t ID_BYTES = 16;

    // 128 bit CSPRNG -> 32 hexa karakter. @throws std::runtime_error
    static std::string generate();
};

} // namespace Scroll::Core
