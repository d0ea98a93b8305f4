#pragma once
#include <string>

namespace Tether {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string start_url;

    // Request target for an HTTP upgrade: path plus query.
    std::string target() const;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string default_port(const std::string& scheme);
    static bool        is_websocket(const std::string& url);
};

}  // namespace Utils
}  // namespace Tether
