#pragma once
#include <cstddef>

namespace Tether {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_IO_THREADS       = 1;
    static constexpr int         DEFAULT_TIMEOUT_MS       = 30000;  // Predicate waits
    static constexpr int         DEFAULT_CLOSE_TIMEOUT_MS = 10000;  // Blocking dispose
    static constexpr std::size_t DEFAULT_MAX_MESSAGE_SIZE = 256 * 1024 * 1024;
    static constexpr const char* DEFAULT_ENDPOINT         = "ws://127.0.0.1:9222";
    static constexpr const char* DEFAULT_LOG_LEVEL        = "info";
    static constexpr const char* USER_AGENT               = "Tether/0.1";
};

}  // namespace Core
}  // namespace Tether
