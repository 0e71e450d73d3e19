#include "FrameAdapter.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

FrameParseResult parse_frame(const std::string& text) {
    json msg = json::parse(text, nullptr, false);
    if (msg.is_discarded())
        return MalformedFrame{"not json"};
    if (!msg.is_object())
        return MalformedFrame{"not an object"};
    if (!msg.contains("data") || msg["data"].is_null())
        return MalformedFrame{"no data"};

    // data may be array[0] or the object itself
    const json& data = msg["data"];
    const json* element = &data;
    if (data.is_array()) {
        if (data.empty())
            return MalformedFrame{"empty data"};
        element = &data[0];
    }
    if (!element->is_object())
        return MalformedFrame{"data element is not an object"};

    try {
        return ParsedFrame{element->get<Ticker>()};
    } catch (const json::exception& e) {
        return MalformedFrame{e.what()};
    }
}

std::function<void(const std::string&)> make_frame_adapter(TickerCallback callback) {
    return [cb = std::move(callback)](const std::string& text) {
        auto result = parse_frame(text);
        if (auto* frame = std::get_if<ParsedFrame>(&result)) {
            cb(frame->ticker);
        }
        // MalformedFrame: discarded
    };
}
