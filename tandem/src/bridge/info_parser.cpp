#include "info_parser.hpp"

#include <charconv>
#include <sstream>

namespace tandem_bridge {

namespace {

template <typename T>
std::optional<T> parseNumber(const std::string &text) {
    T out{};
    const char *first = text.data();
    const char *last = first + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return out;
}

} // namespace

bool SearchInfo::empty() const {
    return !depth && !seldepth && !nodes && !nps && !hashfull && !time_ms && !score_cp && !score_mate &&
           pv.empty() && !text;
}

nlohmann::ordered_json SearchInfo::toJson() const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    if (text) j["string"] = *text;
    if (depth) j["depth"] = *depth;
    if (seldepth) j["seldepth"] = *seldepth;
    if (nodes) j["nodes"] = *nodes;
    if (nps) j["nps"] = *nps;
    if (hashfull) j["hashfull"] = *hashfull;
    if (time_ms) j["time"] = *time_ms;
    if (score_cp) j["score"] = nlohmann::ordered_json{{"cp", *score_cp}};
    if (score_mate) j["score"] = nlohmann::ordered_json{{"mate", *score_mate}};
    if (!pv.empty()) j["pv"] = pv;
    return j;
}

std::optional<SearchInfo> parseInfoLine(const std::string &line) {
    std::istringstream iss(line);
    std::vector<std::string> tokens;
    std::string tok;
    while (iss >> tok) tokens.push_back(tok);
    if (tokens.empty() || tokens[0] != "info") return std::nullopt;

    SearchInfo info;
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        const std::string &key = tokens[i];
        const bool has_value = i + 1 < tokens.size();

        if (key == "string") {
            // The rest of the line verbatim
            const auto pos = line.find("string");
            std::string rest = line.substr(pos + 6);
            const auto first = rest.find_first_not_of(' ');
            info.text = first == std::string::npos ? std::string() : rest.substr(first);
            break;
        }
        if (key == "pv") {
            for (std::size_t k = i + 1; k < tokens.size(); ++k) info.pv.push_back(tokens[k]);
            break;
        }
        if (key == "score") {
            if (i + 2 < tokens.size()) {
                if (tokens[i + 1] == "cp") info.score_cp = parseNumber<int>(tokens[i + 2]);
                else if (tokens[i + 1] == "mate") info.score_mate = parseNumber<int>(tokens[i + 2]);
                i += 2;
            }
            continue;
        }
        if (!has_value) continue;
        const std::string &value = tokens[i + 1];
        if (key == "depth") {
            info.depth = parseNumber<int>(value);
            ++i;
        } else if (key == "seldepth") {
            info.seldepth = parseNumber<int>(value);
            ++i;
        } else if (key == "nodes") {
            info.nodes = parseNumber<std::uint64_t>(value);
            ++i;
        } else if (key == "nps") {
            info.nps = parseNumber<std::uint64_t>(value);
            ++i;
        } else if (key == "hashfull") {
            info.hashfull = parseNumber<int>(value);
            ++i;
        } else if (key == "time") {
            info.time_ms = parseNumber<std::uint64_t>(value);
            ++i;
        }
    }

    if (info.empty()) return std::nullopt;
    return info;
}

} // namespace tandem_bridge
