#include "system.hpp"

#if _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#include <io.h>
#else
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#include <filesystem>

namespace utils {
std::string GetDefaultPath() {
#if _WIN32
    char path[MAX_PATH];
    GetModuleFileNameA(nullptr, path, MAX_PATH);
    return std::filesystem::path(path).parent_path().string();
#else
    char path[1024];
    ssize_t len = readlink("/proc/self/exe", path, sizeof(path) - 1);
    if (len != -1) {
        path[len] = '\0';
        return std::filesystem::path(path).parent_path().string();
    }
    return {};
#endif
}

bool IsPrivilegedUser() {
#if _WIN32
    return false;
#else
    return geteuid() == 0;
#endif
}

std::string EffectiveUserName() {
#if _WIN32
    char name[256];
    DWORD size = sizeof(name);
    if (GetUserNameA(name, &size)) {
        return name;
    }
    return {};
#else
    uid_t uid = geteuid();
    if (const passwd *pw = getpwuid(uid)) {
        return pw->pw_name;
    }
    return std::to_string(uid);
#endif
}

bool IsTerminal(int fd) {
#if _WIN32
    return _isatty(fd) != 0;
#else
    return isatty(fd) != 0;
#endif
}
}  // namespace utils
