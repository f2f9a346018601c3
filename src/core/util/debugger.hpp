/// @file debugger.hpp
/// @brief Debugger presence detection

#pragma once

namespace verinfo {

/// @brief Check whether a debugger is attached to the current process
///
/// Windows: IsDebuggerPresent(). Linux: non-zero TracerPid in /proc/self/status.
/// Other platforms report false.
[[nodiscard]] bool isDebuggerAttached() noexcept;

}  // namespace verinfo
