#pragma once

#include "chess.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace tandem {

enum class Bound : std::uint8_t { NONE = 0, EXACT = 1, LOWER = 2, UPPER = 3 };

struct TTEntry {
    std::uint64_t key = 0;
    std::int32_t score = 0;
    std::int16_t depth = -1;
    std::uint16_t move = 0; // chess::Move raw encoding, 0 => none
    Bound bound = Bound::NONE;
    std::uint8_t generation = 0;

    bool empty() const { return bound == Bound::NONE; }
    chess::Move bestMove() const { return move == 0 ? chess::Move(chess::Move::NO_MOVE) : chess::Move(move); }
};

// Bucketed transposition table. Each bucket holds BUCKET_SIZE entries and the
// bucket count is a power of two so the index is a mask of the key.
class TranspositionTable {
public:
    static constexpr std::size_t BUCKET_SIZE = 4;

    explicit TranspositionTable(std::size_t megabytes = 16);

    // Reallocates and clears. Zero megabytes still yields one bucket.
    void resize(std::size_t megabytes);
    void clear();

    // Called once per top-level search.
    void newSearch() { ++generation_; }
    std::uint8_t generation() const { return generation_; }

    // Score of the returned entry is already converted to be relative to ply.
    std::optional<TTEntry> probe(std::uint64_t key, int ply = 0) const;
    void store(std::uint64_t key, int depth, int score, Bound bound, chess::Move move, int ply = 0);

    // Permille of sampled entries written during the current generation.
    int hashfull() const;

    std::size_t megabytes() const { return megabytes_; }
    std::size_t entryCount() const { return buckets_.size() * BUCKET_SIZE; }

    // Mate scores are stored as distance from the node, not from the root.
    static int toTT(int score, int ply);
    static int fromTT(int score, int ply);

private:
    using Bucket = std::array<TTEntry, BUCKET_SIZE>;

    std::size_t indexOf(std::uint64_t key) const { return static_cast<std::size_t>(key) & mask_; }

    std::vector<Bucket> buckets_;
    std::size_t mask_ = 0;
    std::size_t megabytes_ = 0;
    std::uint8_t generation_ = 0;
};

} // namespace tandem
