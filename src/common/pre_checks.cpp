#include "pre_checks.hpp"

#include <filesystem>
#include <fstream>

#include "../utils/logger.hpp"
#include "../utils/system.hpp"

namespace pre_checks {
Err FileExists(const char *filename) {
    if (std::filesystem::is_directory(filename)) {
        logger::Error("input not found: %s", filename);
        return Err::FileNotFound;
    }
    std::ifstream file(filename);
    if (!file.is_open()) {
        logger::Error("input not found: %s", filename);
        return Err::FileNotFound;
    }

    return Err::Ok;
}

Err RunningUnprivileged(bool required) {
    if (!utils::IsPrivilegedUser()) {
        logger::Debug("Running as `%s`", utils::EffectiveUserName().c_str());
        return Err::Ok;
    }

    if (required) {
        logger::Error("Running as `%s`, refusing to continue",
                      utils::EffectiveUserName().c_str());
        return Err::PrivilegedUser;
    }

    logger::Warn("Running as `%s`, use an unprivileged account",
                 utils::EffectiveUserName().c_str());
    return Err::Ok;
}
}  // namespace pre_checks
