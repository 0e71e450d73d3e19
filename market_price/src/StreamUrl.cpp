#include "StreamUrl.hpp"
#include <stdexcept>

StreamUrl parse_stream_url(const std::string& url) {
    const std::string scheme = "wss://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        throw std::invalid_argument("stream url must start with wss:// : " + url);
    }

    StreamUrl out;
    const std::string rest = url.substr(scheme.size());

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) out.target = rest.substr(slash);

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        out.port = authority.substr(colon + 1);
        authority = authority.substr(0, colon);
        if (out.port.empty()) throw std::invalid_argument("empty port in stream url: " + url);
    }
    if (authority.empty()) {
        throw std::invalid_argument("missing host in stream url: " + url);
    }
    out.host = authority;
    return out;
}
