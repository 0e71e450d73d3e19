#pragma once
#include <string>

// wss://host[:port][/target]
struct StreamUrl {
    std::string host;
    std::string port   = "443";
    std::string target = "/";
};

// Throws std::invalid_argument for non-wss schemes or a missing host.
StreamUrl parse_stream_url(const std::string& url);
