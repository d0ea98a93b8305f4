#pragma once
#include <cstddef>
#include <string>

#include "../types/constants.hpp"

namespace Tether {
namespace Core {

struct Config {
    std::string endpoint           = Constants::DEFAULT_ENDPOINT;
    int         io_threads         = Constants::DEFAULT_IO_THREADS;
    int         default_timeout_ms = Constants::DEFAULT_TIMEOUT_MS;
    int         close_timeout_ms   = Constants::DEFAULT_CLOSE_TIMEOUT_MS;
    std::size_t max_message_size   = Constants::DEFAULT_MAX_MESSAGE_SIZE;
    std::string log_level          = Constants::DEFAULT_LOG_LEVEL;

    static Config load(const std::string& path);
    static Config from_yaml(const std::string& text);

    // Pushes log_level into the global Logger.
    void apply_logging() const;
};

}  // namespace Core
}  // namespace Tether
