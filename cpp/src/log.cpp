#include "stegbridge/log.hpp"

#include "stegbridge/cli_colors.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>

namespace stegbridge::log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::Info)};

std::string Timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return buffer;
}

const char* LevelName(Level level) {
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARNING";
        case Level::Error:
            return "ERROR";
    }
    return "INFO";
}

const char* LevelColor(Level level) {
    switch (level) {
        case Level::Debug:
            return cli::color::BRIGHT_BLACK;
        case Level::Info:
            return cli::color::CYAN;
        case Level::Warn:
            return cli::color::YELLOW;
        case Level::Error:
            return cli::color::BOLD_RED;
    }
    return cli::color::RESET;
}

void Write(Level level, const std::string& message) {
    if (static_cast<int>(level) < g_level.load()) {
        return;
    }
    // Build the whole line first so concurrent requests do not interleave output.
    std::ostringstream line;
    line << cli::Dim(Timestamp()) << " "
         << cli::Colorize(LevelName(level), LevelColor(level), std::cerr) << " "
         << message << "\n";
    std::cerr << line.str() << std::flush;
}

}  // namespace

void SetLevel(Level level) {
    g_level.store(static_cast<int>(level));
}

Level GetLevel() {
    return static_cast<Level>(g_level.load());
}

void Debug(const std::string& message) {
    Write(Level::Debug, message);
}

void Info(const std::string& message) {
    Write(Level::Info, message);
}

void Warn(const std::string& message) {
    Write(Level::Warn, message);
}

void Error(const std::string& message) {
    Write(Level::Error, message);
}

}  // namespace stegbridge::log
