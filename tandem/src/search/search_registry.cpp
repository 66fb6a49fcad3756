#include "search_registry.hpp"
#include "tandem_search.hpp"
#include "root_refiner.hpp"

#include <algorithm>
#include <cctype>

namespace tandem {

namespace {

std::unique_ptr<SearchAlgo> makeHybrid(Options &options, const TimeHandler *time_handler) {
    return std::make_unique<TandemSearch>(options, time_handler, true);
}

std::unique_ptr<SearchAlgo> makeAlphaBeta(Options &options, const TimeHandler *time_handler) {
    return std::make_unique<TandemSearch>(options, time_handler, false);
}

} // namespace

const std::array<SearchRegistration, 2> &searchRegistry() {
    static const std::array<SearchRegistration, 2> registry = {{
        {"hybrid", "alpha-beta with root refinement", &makeHybrid},
        {"ab", "alpha-beta only", &makeAlphaBeta},
    }};
    return registry;
}

std::unique_ptr<SearchAlgo> makeSearch(std::string_view name, Options &options, const TimeHandler *time_handler) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto &entry : searchRegistry()) {
        if (entry.name == key) return entry.make(options, time_handler);
    }
    return nullptr;
}

std::vector<std::string> uciOptionLines() {
    std::vector<std::string> lines;
    lines.emplace_back("option name Hash type spin default 16 min 1 max 4096");
    std::string engines = "option name Engine type combo default " + std::string(searchRegistry().front().name);
    for (const auto &entry : searchRegistry()) {
        engines += " var ";
        engines += entry.name;
    }
    lines.push_back(std::move(engines));
    lines.emplace_back("option name Debug type check default false");
    lines.push_back("option name Seed type spin default " + std::to_string(RefinerConfig{}.seed) +
                    " min 0 max 2147483647");
    lines.emplace_back("option name SafetyMargin type spin default 20 min 0 max 1000");
    lines.emplace_back("option name RefineReserve type spin default 15 min 0 max 90");
    lines.emplace_back("option name MoveOverhead type spin default 50 min 0 max 5000");
    return lines;
}

} // namespace tandem
