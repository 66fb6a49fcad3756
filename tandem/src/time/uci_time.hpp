#pragma once

#include "time_handler.hpp"
#include "../search/search_algo.hpp"

#include <algorithm>

namespace tandem {

class UciTimeHandler : public TimeHandler {
public:
	explicit UciTimeHandler(unsigned long long move_overhead_ms = 50ULL) : overhead_ms_(move_overhead_ms) {}

	void setMoveOverhead(unsigned long long ms) { overhead_ms_ = ms; }

	TimeBudget selectTimeBudget(const Limits &limits, chess::Color side_to_move) const override {
		// Infinite or depth/rollout limited: no time cap from handler
		if (limits.infinite) return TimeBudget{0ULL, 0ULL};

		// go movetime X: the whole of X is the budget, safety margin is applied by the scheduler
		if (limits.movetime_ms > 0ULL) {
			return TimeBudget{limits.movetime_ms, limits.movetime_ms};
		}

		unsigned long long time_left = (side_to_move == chess::Color::WHITE) ? limits.wtime_ms : limits.btime_ms;
		unsigned long long inc_ms    = (side_to_move == chess::Color::WHITE) ? limits.winc_ms  : limits.binc_ms;
		if (time_left == 0ULL) return TimeBudget{0ULL, 0ULL};

		int moves_to_go = limits.movestogo > 0 ? limits.movestogo : 30;

		unsigned long long time_after_overhead = (time_left > overhead_ms_) ? (time_left - overhead_ms_) : 0ULL;
		unsigned long long total = time_after_overhead + static_cast<unsigned long long>(moves_to_go - 1) * inc_ms;

		// Soft: an even share of the remaining time plus most of the increment
		unsigned long long soft = total / static_cast<unsigned long long>(moves_to_go);
		// Hard: never more than a third of what is on the clock
		unsigned long long hard = std::min(soft * 3ULL, time_after_overhead / 3ULL);

		soft = std::min(soft, hard);
		hard = std::max(hard, 1ULL);
		soft = std::max(soft, 1ULL);

		return TimeBudget{soft, hard};
	}

private:
	unsigned long long overhead_ms_;
};

} // namespace tandem
