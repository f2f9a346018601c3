/// @file debugger.cpp
/// @brief Debugger presence detection implementation

#include "debugger.hpp"

#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #include <Windows.h>
#else
    #include <fstream>
    #include <string>
#endif

namespace verinfo {

bool isDebuggerAttached() noexcept {
#ifdef _WIN32
    return IsDebuggerPresent() != FALSE;
#elif defined(__linux__)
    try {
        std::ifstream status("/proc/self/status");
        std::string line;
        while (std::getline(status, line)) {
            if (line.starts_with("TracerPid:")) {
                return std::stoi(line.substr(10)) != 0;
            }
        }
    } catch (const std::exception&) {
        // Unreadable or malformed status file: assume no tracer
    }
    return false;
#else
    return false;
#endif
}

}  // namespace verinfo
