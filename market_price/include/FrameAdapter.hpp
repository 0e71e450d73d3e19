#pragma once
#include "Ticker.hpp"
#include <functional>
#include <string>
#include <variant>

// Inbound frame: {"arg":{...},"data":[<ticker>, ...]}
struct ParsedFrame {
    Ticker ticker;   // first data element
};

struct MalformedFrame {
    std::string reason;
};

using FrameParseResult = std::variant<ParsedFrame, MalformedFrame>;

using TickerCallback = std::function<void(const Ticker&)>;

// Never throws; anything that does not yield a ticker object is Malformed.
FrameParseResult parse_frame(const std::string& text);

// Wraps the caller's callback as a raw text-frame handler.
// Malformed frames (event acks, pongs, garbage) are dropped.
std::function<void(const std::string&)> make_frame_adapter(TickerCallback callback);
