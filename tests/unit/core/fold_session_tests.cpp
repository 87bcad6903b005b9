#include <gtest/gtest.h>

#include "tfold/core/fold_session.hpp"

using tfold::core::FoldSession;
using tfold::core::FoldState;

TEST(FoldSession, StartsWithoutOverrides)
{
    FoldSession session;
    EXPECT_FALSE(session.globalDefault());
    EXPECT_EQ(session.defaultState(), FoldState::Unfolded);
    EXPECT_FALSE(session.hasOverrides());
    EXPECT_FALSE(session.lookupState("root").has_value());

    FoldSession folded(true);
    EXPECT_EQ(folded.defaultState(), FoldState::Folded);
}

TEST(FoldSession, LatestSaveWins)
{
    FoldSession session;
    session.saveState("root", FoldState::Folded);
    session.saveState("root", FoldState::Unfolded);
    session.saveState("other", FoldState::Folded);

    EXPECT_EQ(session.overrideCount(), 2u);
    EXPECT_EQ(session.lookupState("root"), FoldState::Unfolded);
    EXPECT_EQ(session.lookupState("other"), FoldState::Folded);
}

TEST(FoldSession, ResetOverridesKeepsDefault)
{
    FoldSession session;
    session.setGlobalDefault(true);
    session.saveState("root", FoldState::Unfolded);

    session.resetOverrides();
    EXPECT_FALSE(session.hasOverrides());
    EXPECT_TRUE(session.globalDefault());

    session.saveState("root", FoldState::Folded);
    session.reset();
    EXPECT_FALSE(session.hasOverrides());
    EXPECT_FALSE(session.globalDefault());
}
