#ifndef UTILS_SYSTEM_HPP
#define UTILS_SYSTEM_HPP

#include <string>

namespace utils {
// Directory containing the running executable, empty if unknown.
std::string GetDefaultPath();

bool IsPrivilegedUser();
std::string EffectiveUserName();
bool IsTerminal(int fd);
}  // namespace utils

#endif
