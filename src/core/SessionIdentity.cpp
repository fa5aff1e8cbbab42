#include "core/SessionIdentity.hpp"
#include "security/BackupCipher.hpp"
#include "utils/StringUtils.hpp"
#include <array>
#include <cstdint>

namespace Scroll::Core {

std::string SessionIdentity::generate() {
    std::array<uint8_t, ID_BYTES> raw{};
    Security::randomBytes(raw.data(), raw.size());
    return ScrollUtils::toHex(raw.data(), raw.size());
}

} // namespace Scroll::Core
