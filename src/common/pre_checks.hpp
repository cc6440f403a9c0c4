#ifndef COMMON_PRE_CHECKS_HPP
#define COMMON_PRE_CHECKS_HPP

#include "../utils/errors.hpp"

namespace pre_checks {
Err FileExists(const char *filename);

// Logs a warning when running as an administrative user. With `required`
// set this is an error instead.
Err RunningUnprivileged(bool required);
}  // namespace pre_checks

#endif
