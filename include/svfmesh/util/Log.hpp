#pragma once

#include <string>

namespace svfmesh {
namespace log {

enum class Level {
    Info = 0,
    Warn = 1,
    Off = 2,
};

// Минимальный уровень, который попадает в вывод (по умолчанию Warn).
void setLevel(Level level);
Level level();

void info(const std::string& msg);
void warn(const std::string& msg);

} // namespace log
} // namespace svfmesh
