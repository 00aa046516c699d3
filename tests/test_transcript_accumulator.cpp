#include "pipeline/transcript_accumulator.hpp"

#include <gtest/gtest.h>

TEST(TranscriptionAccumulator, PartialsReviseTheOpenSegmentOnly) {
    TranscriptionAccumulator acc;
    acc.apply({1, "Tell me", false});
    acc.apply({1, "Tell me about", false});

    EXPECT_EQ(acc.currentSegment(), "Tell me about");
    EXPECT_TRUE(acc.accumulatedText().empty());
    EXPECT_EQ(acc.displayText(), "Tell me about");
}

TEST(TranscriptionAccumulator, FinalsAppendAndClearTheOpenSegment) {
    TranscriptionAccumulator acc;
    acc.apply({1, "Thanks for coming in.", true});
    acc.apply({2, "Tell me about", false});
    acc.apply({2, "Tell me about a conflict.", true});

    EXPECT_EQ(acc.accumulatedText(), "Thanks for coming in. Tell me about a conflict.");
    EXPECT_TRUE(acc.currentSegment().empty());
    EXPECT_EQ(acc.confirmedSegments(), 2u);
}

TEST(TranscriptionAccumulator, RepeatedFinalIsNotAppendedTwice) {
    TranscriptionAccumulator acc;
    EXPECT_TRUE(acc.apply({3, "Hello there.", true}));
    EXPECT_FALSE(acc.apply({3, "Hello there.", true}));
    EXPECT_FALSE(acc.apply({2, "late partial", false}));

    EXPECT_EQ(acc.accumulatedText(), "Hello there.");
    EXPECT_TRUE(acc.currentSegment().empty());
}

TEST(TranscriptionAccumulator, SnapshotIsACopyAndResetEmptiesEverything) {
    TranscriptionAccumulator acc;
    acc.apply({1, "What is your biggest strength?", true});
    acc.apply({2, "and", false});

    const std::string snap = acc.snapshot();
    acc.resetBoundary();

    EXPECT_EQ(snap, "What is your biggest strength?");
    EXPECT_TRUE(acc.empty());

    // Segment ids keep growing after a boundary.
    EXPECT_FALSE(acc.apply({1, "stale", true}));
    EXPECT_TRUE(acc.apply({3, "Next one.", true}));
}
