/// @file Diagnostics.hpp
/// @brief Process-wide verbosity for the std::cerr diagnostics
/// @details Components write "[ComponentName] message" lines to std::cerr
/// when the level allows it. Default is silent.

#pragma once

#include <atomic>

namespace Stoichiometrica {
namespace Diagnostics {

constexpr int kSilent = 0;
constexpr int kWarnings = 1;
constexpr int kDebug = 2;

inline std::atomic<int>& verbosityLevel() {
    static std::atomic<int> level{kSilent};
    return level;
}

inline int verbosity() { return verbosityLevel().load(); }

inline void setVerbosity(int level) { verbosityLevel().store(level); }

inline bool warningsEnabled() { return verbosity() >= kWarnings; }

inline bool debugEnabled() { return verbosity() >= kDebug; }

} // namespace Diagnostics
} // namespace Stoichiometrica
