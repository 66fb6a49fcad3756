#include "search/tt.hpp"
#include "score.hpp"

#include <gtest/gtest.h>

using tandem::Bound;
using tandem::TranspositionTable;

namespace {

chess::Move someMove() {
    return chess::uci::uciToMove(chess::Board(), "e2e4");
}

} // namespace

TEST(TranspositionTable, StoreThenProbe) {
    TranspositionTable tt(1);
    tt.store(0x1234, 5, 77, Bound::EXACT, someMove());

    const auto entry = tt.probe(0x1234);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->depth, 5);
    EXPECT_EQ(entry->score, 77);
    EXPECT_EQ(entry->bound, Bound::EXACT);
    EXPECT_EQ(entry->bestMove(), someMove());

    EXPECT_FALSE(tt.probe(0x9999).has_value());
}

TEST(TranspositionTable, MateScoresAreRelativeToPly) {
    TranspositionTable tt(1);
    // Mate found 3 plies below a node at ply 4: mate in 7 from the root.
    tt.store(42, 3, tandem::mate_in(7), Bound::EXACT, someMove(), 4);

    // Reached again at ply 2, the same mate is 5 plies away.
    const auto entry = tt.probe(42, 2);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->score, tandem::mate_in(5));

    EXPECT_EQ(TranspositionTable::fromTT(TranspositionTable::toTT(-tandem::mate_in(9), 3), 3),
              -tandem::mate_in(9));
    EXPECT_EQ(TranspositionTable::toTT(123, 10), 123);
}

TEST(TranspositionTable, SameKeyReplacement) {
    TranspositionTable tt(1);
    tt.store(7, 6, 10, Bound::LOWER, someMove());

    // Shallower result of the same search does not replace a deeper one.
    tt.store(7, 2, 99, Bound::EXACT, chess::Move(chess::Move::NO_MOVE));
    EXPECT_EQ(tt.probe(7)->depth, 6);
    EXPECT_EQ(tt.probe(7)->score, 10);

    // Deeper result replaces, and keeps the old move when it has none.
    tt.store(7, 8, 20, Bound::EXACT, chess::Move(chess::Move::NO_MOVE));
    EXPECT_EQ(tt.probe(7)->depth, 8);
    EXPECT_EQ(tt.probe(7)->score, 20);
    EXPECT_EQ(tt.probe(7)->bestMove(), someMove());

    // A later search overwrites even with less depth.
    tt.newSearch();
    tt.store(7, 1, -5, Bound::UPPER, chess::Move(chess::Move::NO_MOVE));
    EXPECT_EQ(tt.probe(7)->depth, 1);
    EXPECT_EQ(tt.probe(7)->bound, Bound::UPPER);
}

TEST(TranspositionTable, FullBucketEvictsShallowest) {
    TranspositionTable tt(0);
    ASSERT_EQ(tt.entryCount(), TranspositionTable::BUCKET_SIZE);

    tt.store(1, 5, 0, Bound::EXACT, someMove());
    tt.store(2, 2, 0, Bound::EXACT, someMove());
    tt.store(3, 7, 0, Bound::EXACT, someMove());
    tt.store(4, 9, 0, Bound::EXACT, someMove());
    tt.store(5, 4, 0, Bound::EXACT, someMove());

    EXPECT_FALSE(tt.probe(2).has_value());
    EXPECT_TRUE(tt.probe(1).has_value());
    EXPECT_TRUE(tt.probe(3).has_value());
    EXPECT_TRUE(tt.probe(4).has_value());
    EXPECT_TRUE(tt.probe(5).has_value());
}

TEST(TranspositionTable, ClearAndHashfull) {
    TranspositionTable tt(1);
    EXPECT_EQ(tt.hashfull(), 0);
    for (std::uint64_t k = 0; k < 20000; ++k) tt.store(k * 0x9E3779B97F4A7C15ULL, 1, 0, Bound::EXACT, someMove());
    EXPECT_GT(tt.hashfull(), 0);

    tt.clear();
    EXPECT_EQ(tt.hashfull(), 0);
    EXPECT_FALSE(tt.probe(0).has_value());
}
