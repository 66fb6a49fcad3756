#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tandem_bridge {

// Fields of one "info ..." line. Missing or unparsable fields stay empty.
struct SearchInfo {
    std::optional<int> depth;
    std::optional<int> seldepth;
    std::optional<std::uint64_t> nodes;
    std::optional<std::uint64_t> nps;
    std::optional<int> hashfull;
    std::optional<std::uint64_t> time_ms;
    std::optional<int> score_cp;
    std::optional<int> score_mate;
    std::vector<std::string> pv;
    std::optional<std::string> text; // info string ...

    bool empty() const;
    nlohmann::ordered_json toJson() const;
};

// nullopt when the line is not an info line or carries nothing recognised.
std::optional<SearchInfo> parseInfoLine(const std::string &line);

} // namespace tandem_bridge
