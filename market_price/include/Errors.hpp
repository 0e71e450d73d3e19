#pragma once
#include <stdexcept>
#include <string>

// REST instrument fetch failed (network, HTTP status or payload).
class FetchError : public std::runtime_error {
public:
    explicit FetchError(const std::string& what) : std::runtime_error(what) {}
};

// Stream transport refused a send/close.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

class InvalidStateError : public std::logic_error {
public:
    explicit InvalidStateError(const std::string& what) : std::logic_error(what) {}
};
