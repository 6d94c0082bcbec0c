#pragma once

#include <format>
#include <string_view>
#include <utility>

// Stage log lines on stderr: "<utc timestamp> [voicenote] LEVEL component: message".
// Info is only printed in verbose mode; warnings and errors always are.
namespace logging {

enum class Level { Info, Warn, Error };

void set_verbose(bool verbose);
bool verbose();

void write(Level level, std::string_view component, std::string_view msg);

template <typename... Args>
void info(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
    if (!verbose()) return;
    write(Level::Info, component, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
    write(Level::Warn, component, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
    write(Level::Error, component, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace logging
