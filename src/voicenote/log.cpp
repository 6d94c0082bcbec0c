#include "log.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <print>

namespace logging {

namespace {

std::atomic<bool> g_verbose{false};
std::mutex g_write_mutex;

std::string_view level_name(Level level) {
    switch (level) {
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "?";
}

} // namespace

void set_verbose(bool verbose) {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool verbose() {
    return g_verbose.load(std::memory_order_relaxed);
}

void write(Level level, std::string_view component, std::string_view msg) {
    auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());

    std::lock_guard lock(g_write_mutex);
    std::println(stderr, "{:%FT%TZ} [voicenote] {} {}: {}", now, level_name(level), component, msg);
}

} // namespace logging
