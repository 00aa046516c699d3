#include "pipeline/context_store.hpp"

#include <gtest/gtest.h>

TEST(ContextStore, StartsEmptyAndNeverNull) {
    ContextStore store;
    ASSERT_NE(store.current(), nullptr);
    EXPECT_TRUE(store.current()->empty());
    EXPECT_FALSE(store.hasContext());
    EXPECT_EQ(store.version(), 0u);
}

TEST(ContextStore, UpdateInstallsANewBaselineWithoutTouchingOldSnapshots) {
    ContextStore store;

    ContextPayload first;
    first.resumeText = "Backend engineer";
    EXPECT_EQ(store.update(first), 1u);
    const ContextStore::Snapshot held = store.current();

    ContextPayload second;
    second.talkingPoints = {"Shipped payments v2"};
    EXPECT_EQ(store.update(second), 2u);

    EXPECT_EQ(held->resumeText, "Backend engineer");
    EXPECT_TRUE(held->talkingPoints.empty());
    EXPECT_TRUE(store.current()->resumeText.empty());
    EXPECT_EQ(store.current()->talkingPoints.size(), 1u);
    EXPECT_TRUE(store.hasContext());
}

TEST(ContextStore, ClearDropsContextAndBumpsVersion) {
    ContextStore store;
    ContextPayload p;
    p.resumeText = "x";
    store.update(p);
    const auto held = store.current();

    store.clear();
    EXPECT_FALSE(store.hasContext());
    EXPECT_TRUE(store.current()->empty());
    EXPECT_EQ(store.version(), 2u);
    EXPECT_EQ(held->resumeText, "x");
}
