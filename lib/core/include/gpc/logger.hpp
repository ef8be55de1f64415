#pragma once
#include <cstdint>
#include <iomanip>
#include <iostream>

// stream style logging macros, msg can be a << chain:
//   GPC_LOG_INFO("calib", "offset x=" << off.x);
// debug lines only print when GPC_VERBOSE is set (and not "0")

namespace gpc {
namespace log {

uint64_t ms_since_start();
bool verbose();

}   // namespace log
}   // namespace gpc

#define GPC_LOG_AT(stream, level, tag, msg) do { \
    stream << "[" << std::setw(6) << gpc::log::ms_since_start() << " ms] " \
           << level << " " << tag << ": " << msg << std::endl; \
} while(0)

#define GPC_LOG_INFO(tag, msg) GPC_LOG_AT(std::cout, "INFO", tag, msg)
#define GPC_LOG_WARN(tag, msg) GPC_LOG_AT(std::cerr, "WARN", tag, msg)
#define GPC_LOG_DBG(tag, msg) do { if (gpc::log::verbose()) GPC_LOG_AT(std::cout, "DBG ", tag, msg); } while(0)
