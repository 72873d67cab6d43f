#include <svfmesh/util/Log.hpp>

#include <atomic>
#include <iostream>

namespace svfmesh {
namespace log {

namespace {

std::atomic<Level> g_level{Level::Warn};

bool enabled(Level l) {
    return static_cast<int>(l) >= static_cast<int>(g_level.load(std::memory_order_relaxed));
}

} // namespace

void setLevel(Level l) { g_level.store(l, std::memory_order_relaxed); }
Level level() { return g_level.load(std::memory_order_relaxed); }

void info(const std::string& msg) {
    if (enabled(Level::Info)) {
        std::cout << "[svfmesh] INFO: " << msg << '\n';
    }
}

void warn(const std::string& msg) {
    if (enabled(Level::Warn)) {
        std::cerr << "[svfmesh] WARNING: " << msg << '\n';
    }
}

} // namespace log
} // namespace svfmesh
