#pragma once

#include "search_algo.hpp"

#include <array>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tandem {

using SearchFactory = std::unique_ptr<SearchAlgo> (*)(Options &, const TimeHandler *);

struct SearchRegistration {
    std::string_view name;
    std::string_view description;
    SearchFactory make;
};

// Engines selectable through the "Engine" option. The first entry is the default.
const std::array<SearchRegistration, 2> &searchRegistry();

// nullptr for an unknown name. Names match case-insensitively.
std::unique_ptr<SearchAlgo> makeSearch(std::string_view name, Options &options, const TimeHandler *time_handler);

// "option name ..." lines sent in answer to uci.
std::vector<std::string> uciOptionLines();

} // namespace tandem
