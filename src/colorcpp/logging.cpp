#include "colorcpp/logging.hpp"

#include <atomic>

namespace colorcpp {

namespace {
std::atomic<bool> g_logging_enabled{false};
} // namespace

void set_logging_enabled(bool enabled) {
    g_logging_enabled.store(enabled, std::memory_order_relaxed);
}

bool logging_enabled() {
    return g_logging_enabled.load(std::memory_order_relaxed);
}

} // namespace colorcpp
