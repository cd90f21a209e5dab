// src/core/executable_path.h
#pragma once
#include <string>

namespace bridge::core {

    // absolute path of the running binary, empty if it cannot be determined
    std::string getExecutablePath();

    // directory holding the running binary; the default config file lives there
    std::string getExecutableDirectory();

}// namespace bridge::core
