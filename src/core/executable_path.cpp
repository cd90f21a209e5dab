// src/core/executable_path.cpp
#include "executable_path.h"
#include <filesystem>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#else
#include <limits.h>
#include <unistd.h>
#endif

namespace bridge::core {

    std::string getExecutablePath() {
#ifdef _WIN32
        char path[MAX_PATH];
        DWORD count = GetModuleFileNameA(nullptr, path, MAX_PATH);
        return count == 0 ? "" : std::string(path, count);
#else
        char result[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", result, PATH_MAX);
        return count != -1 ? std::string(result, count) : "";
#endif
    }

    std::string getExecutableDirectory() {
        std::string exec_path = getExecutablePath();
        if (exec_path.empty()) {
            std::error_code ec;
            auto cwd = std::filesystem::current_path(ec);
            return ec ? "." : cwd.string();
        }
        return std::filesystem::path(exec_path).parent_path().string();
    }

}// namespace bridge::core
