#pragma once
#include <cstdint>

namespace gpc {

enum class ErrorCode : uint8_t {
    None = 0,
    MalformedSample,        // dropped at the boundary, counted
    CalibrationTimeout,     // not enough stable samples in the session window
    ConfigurationError      // invalid option at construction, fatal
};

const char* to_string(ErrorCode e);

}   // namespace gpc
