#include "Ticker.hpp"

void from_json(const nlohmann::json& j, Ticker& t) {
    t.inst_type   = j.value("instType", "");
    t.inst_id     = j.value("instId", "");
    t.last        = j.value("last", "");
    t.last_sz     = j.value("lastSz", "");
    t.ask_px      = j.value("askPx", "");
    t.ask_sz      = j.value("askSz", "");
    t.bid_px      = j.value("bidPx", "");
    t.bid_sz      = j.value("bidSz", "");
    t.open_24h    = j.value("open24h", "");
    t.high_24h    = j.value("high24h", "");
    t.low_24h     = j.value("low24h", "");
    t.sod_utc0    = j.value("sodUtc0", "");
    t.sod_utc8    = j.value("sodUtc8", "");
    t.vol_ccy_24h = j.value("volCcy24h", "");
    t.vol_24h     = j.value("vol24h", "");
    t.ts          = j.value("ts", "");
}

void to_json(nlohmann::json& j, const Ticker& t) {
    j = nlohmann::json{
        {"instType",  t.inst_type},
        {"instId",    t.inst_id},
        {"last",      t.last},
        {"lastSz",    t.last_sz},
        {"askPx",     t.ask_px},
        {"askSz",     t.ask_sz},
        {"bidPx",     t.bid_px},
        {"bidSz",     t.bid_sz},
        {"open24h",   t.open_24h},
        {"high24h",   t.high_24h},
        {"low24h",    t.low_24h},
        {"sodUtc0",   t.sod_utc0},
        {"sodUtc8",   t.sod_utc8},
        {"volCcy24h", t.vol_ccy_24h},
        {"vol24h",    t.vol_24h},
        {"ts",        t.ts}
    };
}
