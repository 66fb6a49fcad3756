#include "bridge_event.hpp"

namespace tandem_bridge {

const char *toString(EventType type) {
    switch (type) {
    case EventType::Info: return "info";
    case EventType::BestMove: return "bestmove";
    case EventType::Done: return "done";
    case EventType::Error: return "error";
    }
    return "error";
}

BridgeEvent BridgeEvent::info(const SearchInfo &info) {
    return BridgeEvent{EventType::Info, info.toJson()};
}

BridgeEvent BridgeEvent::info(json fields) {
    return BridgeEvent{EventType::Info, std::move(fields)};
}

BridgeEvent BridgeEvent::bestMove(const std::string &move) {
    return BridgeEvent{EventType::BestMove, json{{"move", move}}};
}

BridgeEvent BridgeEvent::done() {
    return BridgeEvent{EventType::Done, json::object()};
}

BridgeEvent BridgeEvent::error(const std::string &message) {
    return BridgeEvent{EventType::Error, json{{"message", message}}};
}

std::string BridgeEvent::move() const {
    return payload.value("move", std::string());
}

std::string BridgeEvent::message() const {
    return payload.value("message", std::string());
}

json BridgeEvent::toJson() const {
    json out = json{{"type", toString(type)}};
    for (auto it = payload.begin(); it != payload.end(); ++it) out[it.key()] = it.value();
    return out;
}

} // namespace tandem_bridge
