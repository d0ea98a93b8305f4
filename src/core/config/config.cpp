#include "config.hpp"
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include "../logger/logger.hpp"

namespace Tether {
namespace Core {

namespace {

void apply_yaml(Config& config, const YAML::Node& yaml) {
    if (!yaml || yaml.IsNull())
        return;
    if (!yaml.IsMap())
        throw std::runtime_error("Error parsing config: top level must be a mapping");

    if (yaml["endpoint"])
        config.endpoint = yaml["endpoint"].as<std::string>();
    if (yaml["ws_endpoint"])
        config.endpoint = yaml["ws_endpoint"].as<std::string>();
    if (yaml["io_threads"])
        config.io_threads = yaml["io_threads"].as<int>();
    if (yaml["default_timeout_ms"])
        config.default_timeout_ms = yaml["default_timeout_ms"].as<int>();
    if (yaml["timeout"])
        config.default_timeout_ms = yaml["timeout"].as<int>();
    if (yaml["close_timeout_ms"])
        config.close_timeout_ms = yaml["close_timeout_ms"].as<int>();
    if (yaml["max_message_size"])
        config.max_message_size = yaml["max_message_size"].as<std::size_t>();
    if (yaml["log_level"])
        config.log_level = yaml["log_level"].as<std::string>();

    if (config.io_threads < 1)
        throw std::runtime_error("Error parsing config: io_threads must be at least 1");
    if (config.default_timeout_ms < 0 || config.close_timeout_ms < 0)
        throw std::runtime_error("Error parsing config: timeouts must not be negative");
}

}  // namespace

Config Config::load(const std::string& path) {
    Config config;
    try {
        apply_yaml(config, YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
    return config;
}

Config Config::from_yaml(const std::string& text) {
    Config config;
    try {
        apply_yaml(config, YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config: " + std::string(e.what()));
    }
    return config;
}

void Config::apply_logging() const {
    try {
        Logger::set_level(Logger::parse_level(log_level));
    } catch (const std::invalid_argument& e) {
        Logger::warn(std::string(e.what()) + ", keeping current level");
    }
}

}  // namespace Core
}  // namespace Tether
