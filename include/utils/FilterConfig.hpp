#pragma once

#include <cstddef>
#include <string>

#include "utils/ConfigTemplates.hpp"

namespace ScrollUtils {

struct FilterConfig {
    // Elfogadjuk, de egyetlen döntés sem olvassa
    double moodThreshold = 0.5;

    std::string backupDir = ScrollTemplates::DEFAULT_BACKUP_DIR;

    // 0 = nincs felső korlát a bemenet méretére
    std::size_t maxInputBytes = 0;
};

}
