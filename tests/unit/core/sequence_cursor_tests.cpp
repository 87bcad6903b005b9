#include <gtest/gtest.h>

#include "tfold/core/message_list.hpp"
#include "tfold/core/sequence_cursor.hpp"

#include <cstddef>
#include <vector>

using tfold::core::MessageFlag;
using tfold::core::MessageList;
using tfold::core::SequenceCursor;
using tfold::core::ThreadRole;

namespace
{

MessageList makeListing()
{
    MessageList list;
    list.appendLine("Search results");
    list.appendMessage("r1", ThreadRole::Root, {}, "first thread");
    list.appendMessage("c1a", ThreadRole::Child, {}, "reply");
    list.appendMessage("c1b", ThreadRole::Child, MessageFlag::Unread, "reply");
    list.appendMessage("o2", ThreadRole::OrphanFirstChild, {}, "orphan");
    list.appendMessage("c2a", ThreadRole::Child, {}, "reply");
    list.appendMessage("x", ThreadRole::Other, {}, "other");
    list.appendMessage("r3", ThreadRole::Root, {}, "last thread");
    return list;
}

} // namespace

TEST(SequenceCursor, ClassifiesRoots)
{
    MessageList list = makeListing();
    SequenceCursor cursor(list);

    EXPECT_FALSE(cursor.isThreadRoot(0));
    EXPECT_TRUE(cursor.isThreadRoot(1));
    EXPECT_FALSE(cursor.isThreadRoot(2));
    EXPECT_TRUE(cursor.isThreadRoot(4));
    EXPECT_FALSE(cursor.isThreadRoot(6));
    EXPECT_TRUE(cursor.isThreadRoot(7));
    EXPECT_FALSE(cursor.isThreadRoot(100));
}

TEST(SequenceCursor, FindsThreadStartBackwards)
{
    MessageList list = makeListing();
    SequenceCursor cursor(list);

    EXPECT_EQ(cursor.findThreadStart(3), 1u);
    EXPECT_EQ(cursor.findThreadStart(1), 1u);
    EXPECT_EQ(cursor.findThreadStart(6), 4u);
    EXPECT_EQ(cursor.findThreadStart(0), 0u);
}

TEST(SequenceCursor, NextThreadReportsEndOfSequence)
{
    MessageList list = makeListing();
    SequenceCursor cursor(list);

    EXPECT_EQ(cursor.findNextThreadStart(1), std::optional<std::size_t>(4));
    EXPECT_EQ(cursor.findNextThreadStart(5), std::optional<std::size_t>(7));
    EXPECT_FALSE(cursor.findNextThreadStart(7).has_value());
    EXPECT_EQ(cursor.threadEnd(7), list.lineCount());
}

TEST(SequenceCursor, PreviousThreadStopsAtFirstThread)
{
    MessageList list = makeListing();
    SequenceCursor cursor(list);

    EXPECT_EQ(cursor.findPrevThreadStart(6), std::optional<std::size_t>(1));
    EXPECT_EQ(cursor.findPrevThreadStart(2), std::optional<std::size_t>(0));
    EXPECT_FALSE(cursor.findPrevThreadStart(0).has_value());
}

TEST(SequenceCursor, ThreadsPartitionTheSequence)
{
    MessageList list = makeListing();
    SequenceCursor cursor(list);

    std::vector<std::size_t> owner(list.lineCount(), 0);
    std::size_t start = 0;
    std::size_t threads = 0;
    while (true)
    {
        const std::size_t end = cursor.threadEnd(start);
        ASSERT_LT(start, end);
        for (std::size_t line = start; line < end; ++line)
            ++owner[line];
        ++threads;
        auto next = cursor.findNextThreadStart(start);
        if (!next)
            break;
        EXPECT_EQ(*next, end);
        start = *next;
    }

    EXPECT_EQ(threads, 4u);
    for (std::size_t count : owner)
        EXPECT_EQ(count, 1u);
}

TEST(SequenceCursor, EmptyListingHasNoThreads)
{
    MessageList list;
    SequenceCursor cursor(list);

    EXPECT_EQ(cursor.findThreadStart(5), 0u);
    EXPECT_FALSE(cursor.findNextThreadStart(0).has_value());
    EXPECT_FALSE(cursor.findPrevThreadStart(0).has_value());
}
