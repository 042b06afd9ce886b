#pragma once

#include <algorithm>
#include <iostream>
#include <utility>

namespace afmtools::log {

enum class VerbosityLevel : int { Quiet = 0, Verbose = 1, Debug = 2 };

inline VerbosityLevel current_level = VerbosityLevel::Quiet;

inline void set_verbosity(int level) {
    level = std::clamp(level, 0, 2);
    current_level = static_cast<VerbosityLevel>(level);
}

constexpr const char* level_name(VerbosityLevel level) {
    switch (level) {
        case VerbosityLevel::Quiet: return "QUIET";
        case VerbosityLevel::Verbose: return "INFO";
        case VerbosityLevel::Debug: return "DEBUG";
    }
    return "INFO";
}

template <typename... Args>
void write_line(std::ostream& stream, const char* tag, Args&&... args) {
    stream << '[' << tag << "] ";
    if constexpr (sizeof...(Args) > 0) {
        ((stream << std::forward<Args>(args) << ' '), ...);
    }
    stream << '\n';
}

template <typename... Args>
void log_impl(VerbosityLevel min_level, Args&&... args) {
    if (current_level < min_level) return;
    write_line(std::cerr, level_name(min_level), std::forward<Args>(args)...);
}

// info prints with -v and above.
template <typename... Args>
void info(Args&&... args) {
    log_impl(VerbosityLevel::Verbose, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(Args&&... args) {
    log_impl(VerbosityLevel::Debug, std::forward<Args>(args)...);
}

// Warnings and errors are printed at every verbosity.
template <typename... Args>
void warn(Args&&... args) {
    write_line(std::cerr, "WARN", std::forward<Args>(args)...);
}

template <typename... Args>
void error(Args&&... args) {
    write_line(std::cerr, "ERROR", std::forward<Args>(args)...);
}

} // namespace afmtools::log

#define LOGI(...) ::afmtools::log::info(__VA_ARGS__)
#define LOGW(...) ::afmtools::log::warn(__VA_ARGS__)
#define LOGE(...) ::afmtools::log::error(__VA_ARGS__)

#if AFM_DEBUG
    #define LOGD(...) ::afmtools::log::debug(__VA_ARGS__)
#else
    #define LOGD(...) do {} while(false)
#endif
