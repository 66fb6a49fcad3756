#include "tt.hpp"
#include "../score.hpp"

#include <algorithm>

namespace tandem {

TranspositionTable::TranspositionTable(std::size_t megabytes) {
    resize(megabytes);
}

void TranspositionTable::resize(std::size_t megabytes) {
    const std::size_t bytes = megabytes * 1024 * 1024;
    const std::size_t wanted = bytes / sizeof(Bucket);
    std::size_t count = 1;
    while (count * 2 <= wanted) count *= 2;

    buckets_.assign(count, Bucket{});
    mask_ = count - 1;
    megabytes_ = megabytes;
    generation_ = 0;
}

void TranspositionTable::clear() {
    std::fill(buckets_.begin(), buckets_.end(), Bucket{});
    generation_ = 0;
}

int TranspositionTable::toTT(int score, int ply) {
    if (score >= MATE_BOUND) return score + ply;
    if (score <= -MATE_BOUND) return score - ply;
    return score;
}

int TranspositionTable::fromTT(int score, int ply) {
    if (score >= MATE_BOUND) return score - ply;
    if (score <= -MATE_BOUND) return score + ply;
    return score;
}

std::optional<TTEntry> TranspositionTable::probe(std::uint64_t key, int ply) const {
    const Bucket &bucket = buckets_[indexOf(key)];
    for (const TTEntry &e : bucket) {
        if (e.empty() || e.key != key) continue;
        TTEntry out = e;
        out.score = fromTT(e.score, ply);
        return out;
    }
    return std::nullopt;
}

void TranspositionTable::store(std::uint64_t key, int depth, int score, Bound bound, chess::Move move, int ply) {
    Bucket &bucket = buckets_[indexOf(key)];

    auto write = [&](TTEntry &e) {
        // Keep a known best move when the new result carries none.
        const std::uint16_t raw = move == chess::Move::NO_MOVE ? 0 : move.move();
        const bool same = !e.empty() && e.key == key;
        e.move = (raw == 0 && same) ? e.move : raw;
        e.key = key;
        e.score = toTT(score, ply);
        e.depth = static_cast<std::int16_t>(std::max(depth, 0));
        e.bound = bound;
        e.generation = generation_;
    };

    for (TTEntry &e : bucket) {
        if (e.empty() || e.key != key) continue;
        if (depth >= e.depth || e.generation != generation_) write(e);
        return;
    }

    TTEntry *victim = nullptr;
    for (TTEntry &e : bucket) {
        if (e.empty()) {
            victim = &e;
            break;
        }
        if (victim == nullptr || e.depth < victim->depth) {
            victim = &e;
        } else if (e.depth == victim->depth && e.generation != generation_ && victim->generation == generation_) {
            victim = &e;
        }
    }
    write(*victim);
}

int TranspositionTable::hashfull() const {
    const std::size_t sample = std::min<std::size_t>(buckets_.size(), 250);
    std::size_t used = 0;
    std::size_t total = 0;
    for (std::size_t i = 0; i < sample; ++i) {
        for (const TTEntry &e : buckets_[i]) {
            ++total;
            if (!e.empty() && e.generation == generation_) ++used;
        }
    }
    return total == 0 ? 0 : static_cast<int>(used * 1000 / total);
}

} // namespace tandem
