#include "gpc/logger.hpp"
#include <chrono>
#include <cstdlib>   // getenv
#include <string_view>

namespace gpc {
namespace log {

namespace {
using steady = std::chrono::steady_clock;
const auto g_t0 = steady::now();
}

uint64_t ms_since_start() {
    return (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(steady::now() - g_t0).count();
}

bool verbose() {
    static const bool on = [] {
        const char* v = std::getenv("GPC_VERBOSE");
        return v && *v && std::string_view(v) != "0";
    }();
    return on;
}

}   // namespace log
}   // namespace gpc
