#pragma once

#include "info_parser.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace tandem_bridge {

// Insertion ordered so "type" leads every line.
using json = nlohmann::ordered_json;

enum class EventType { Info, BestMove, Done, Error };

const char *toString(EventType type);

// One structured event of a move request, written out as compact JSON.
struct BridgeEvent {
    EventType type = EventType::Done;
    json payload = json::object(); // Info: parsed fields; BestMove: {"move": ...}; Error: {"message": ...}

    static BridgeEvent info(const SearchInfo &info);
    static BridgeEvent info(json fields);
    static BridgeEvent bestMove(const std::string &move);
    static BridgeEvent done();
    static BridgeEvent error(const std::string &message);

    std::string move() const;
    std::string message() const;

    json toJson() const;
    std::string dump() const { return toJson().dump(); }
};

} // namespace tandem_bridge
