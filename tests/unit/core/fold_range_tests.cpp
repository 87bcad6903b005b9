#include <gtest/gtest.h>

#include "tfold/core/fold_range.hpp"
#include "tfold/core/message_list.hpp"

using tfold::core::computeFoldRange;
using tfold::core::MarkSet;
using tfold::core::MessageFlag;
using tfold::core::MessageFlags;
using tfold::core::MessageList;
using tfold::core::ThreadRole;

namespace
{

// root, then children [unread, read, marked, read]
struct MixedThread
{
    MessageList list;
    MarkSet marks;

    MixedThread()
    {
        list.appendMessage("root", ThreadRole::Root, {}, "root");
        list.appendMessage("unread", ThreadRole::Child, MessageFlag::Unread, "unread");
        list.appendMessage("read", ThreadRole::Child, {}, "read");
        list.appendMessage("marked", ThreadRole::Child, {}, "marked");
        list.appendMessage("tail", ThreadRole::Child, {}, "tail");
        marks.mark("marked");
    }
};

} // namespace

TEST(FoldRange, StopsAtFirstUnreadWhenUnreadMayNotFold)
{
    MixedThread thread;
    auto range = computeFoldRange(thread.list, 0, thread.list.lineCount(), false, thread.marks.query());
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->begin, 1u);
    EXPECT_EQ(range->end, 1u);
    EXPECT_EQ(range->hiddenCount, 0u);
    EXPECT_EQ(range->unreadCount, 0u);
}

TEST(FoldRange, StopsBeforeMarkedChildWhenUnreadMayFold)
{
    MixedThread thread;
    auto range = computeFoldRange(thread.list, 0, thread.list.lineCount(), true, thread.marks.query());
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->begin, 1u);
    EXPECT_EQ(range->end, 3u);
    EXPECT_EQ(range->hiddenCount, 2u);
    EXPECT_EQ(range->unreadCount, 1u);
}

TEST(FoldRange, MarkedTakesPrecedenceOverUnread)
{
    MessageList list;
    MarkSet marks;
    list.appendMessage("root", ThreadRole::Root, {}, "root");
    list.appendMessage("a", ThreadRole::Child, {}, "a");
    list.appendMessage("b", ThreadRole::Child, {}, "b");
    list.appendMessage("both", ThreadRole::Child, MessageFlag::Unread, "both");
    list.appendMessage("c", ThreadRole::Child, MessageFlag::Unread, "c");
    marks.mark("both");

    auto range = computeFoldRange(list, 0, list.lineCount(), true, marks.query());
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->end, 3u);
    EXPECT_EQ(range->hiddenCount, 2u);
    // The marked line stops the scan before it is counted as unread.
    EXPECT_EQ(range->unreadCount, 0u);
}

TEST(FoldRange, CountsEveryUnreadWhenFolded)
{
    MessageList list;
    list.appendMessage("root", ThreadRole::Root, {}, "root");
    list.appendMessage("a", ThreadRole::Child, MessageFlag::Unread, "a");
    list.appendMessage("b", ThreadRole::Child, {}, "b");
    list.appendMessage("c", ThreadRole::Child, MessageFlag::Unread | MessageFlag::Flagged, "c");

    auto range = computeFoldRange(list, 0, list.lineCount(), true, {});
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->end, 4u);
    EXPECT_EQ(range->hiddenCount, 3u);
    EXPECT_EQ(range->unreadCount, 2u);
}

TEST(FoldRange, StopsAtThreadEndAndLinesWithoutMetadata)
{
    MessageList list;
    list.appendMessage("root", ThreadRole::Root, {}, "root");
    list.appendMessage("a", ThreadRole::Child, {}, "a");
    list.appendMessage("b", ThreadRole::Child, {}, "b");
    list.appendLine("-- end of results --");
    list.appendMessage("c", ThreadRole::Child, {}, "c");

    auto range = computeFoldRange(list, 0, list.lineCount(), false, {});
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->end, 3u);

    auto bounded = computeFoldRange(list, 0, 2, false, {});
    ASSERT_TRUE(bounded.has_value());
    EXPECT_EQ(bounded->end, 2u);
    EXPECT_EQ(bounded->hiddenCount, 1u);
}

TEST(FoldRange, RootOnlyThreadIsNoOp)
{
    MessageList list;
    list.appendMessage("root", ThreadRole::Root, {}, "root");
    list.appendMessage("next", ThreadRole::Root, {}, "next");

    EXPECT_FALSE(computeFoldRange(list, 0, 1, false, {}).has_value());
    EXPECT_FALSE(computeFoldRange(list, 1, list.lineCount(), true, {}).has_value());
}
