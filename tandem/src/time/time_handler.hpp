#pragma once

#include <cstdint>

#include "chess.hpp"

namespace tandem {

// Forward declaration to avoid circular include with search headers
struct Limits;

class TimeHandler {
public:
	virtual ~TimeHandler() = default;

	struct TimeBudget {
		unsigned long long soft_ms{0}; // budget: searcher and refiner both stop by it
		unsigned long long hard_ms{0}; // upper bound on soft, never planned past
	};

	// Returns soft/hard time budgets in milliseconds for the current side to move.
	// If limits indicate no time control, return {0,0} to mean "unbounded".
	virtual TimeBudget selectTimeBudget(const Limits &limits, chess::Color side_to_move) const = 0;
};

} // namespace tandem
