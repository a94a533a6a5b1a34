#pragma once

#include <string>

namespace stegbridge::log {

enum class Level {
    Debug = 0,
    Info,
    Warn,
    Error
};

void SetLevel(Level level);
Level GetLevel();

void Debug(const std::string& message);
void Info(const std::string& message);
void Warn(const std::string& message);
void Error(const std::string& message);

}  // namespace stegbridge::log
