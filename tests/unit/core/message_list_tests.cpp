#include <gtest/gtest.h>

#include "tfold/core/message_list.hpp"

#include <filesystem>
#include <string>

using tfold::core::loadMessageList;
using tfold::core::messageFlagName;
using tfold::core::parseMessageFlag;
using tfold::core::parseThreadRole;
using tfold::core::threadRoleName;
using tfold::core::MarkSet;
using tfold::core::MessageFlag;
using tfold::core::parseMessageList;
using tfold::core::ThreadRole;

TEST(MessageListParser, ReadsMessagesAndPlainLines)
{
    const char *json = R"([
        "Search: tag:inbox",
        {"id": "m1", "role": "root", "from": "Ada", "subject": "Release planning", "flags": ["unread", "flagged"]},
        {"id": "m2", "text": "  Re: Release planning", "marked": true},
        {"id": "m3", "role": "orphan-first-child", "flags": ["replied", "spam"]},
        {"text": "-- 3 messages --"}
    ])";

    std::string error;
    auto listing = parseMessageList(json, &error);
    ASSERT_TRUE(listing.has_value()) << error;

    const auto &list = listing->messages;
    ASSERT_EQ(list.lineCount(), 5u);
    EXPECT_EQ(list.messageAt(0), nullptr);
    EXPECT_EQ(list.lineText(0), "Search: tag:inbox");

    const auto *root = list.messageAt(1);
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->id, "m1");
    EXPECT_EQ(root->position, 1u);
    EXPECT_EQ(root->threadRole, ThreadRole::Root);
    EXPECT_TRUE(root->isUnread());
    EXPECT_TRUE(root->flags.contains(MessageFlag::Flagged));
    EXPECT_EQ(list.lineText(1), "Ada  Release planning");

    const auto *reply = list.messageAt(2);
    ASSERT_NE(reply, nullptr);
    EXPECT_EQ(reply->threadRole, ThreadRole::Child);
    EXPECT_TRUE(reply->flags.empty());
    EXPECT_TRUE(listing->marks.isMarked("m2"));
    EXPECT_FALSE(listing->marks.isMarked("m1"));

    const auto *orphan = list.messageAt(3);
    ASSERT_NE(orphan, nullptr);
    EXPECT_EQ(orphan->threadRole, ThreadRole::OrphanFirstChild);
    EXPECT_TRUE(orphan->flags.contains(MessageFlag::Replied));
    EXPECT_EQ(list.lineText(3), "m3");

    EXPECT_EQ(list.messageAt(4), nullptr);
    EXPECT_EQ(list.findMessage("m3"), std::optional<std::size_t>(3));
    EXPECT_FALSE(list.findMessage("nope").has_value());
}

TEST(MessageListParser, AcceptsLinesObject)
{
    auto listing = parseMessageList(R"({"lines": [{"id": "a", "role": "root"}]})");
    ASSERT_TRUE(listing.has_value());
    EXPECT_EQ(listing->messages.lineCount(), 1u);
}

TEST(MessageListParser, ReportsErrors)
{
    std::string error;
    EXPECT_FALSE(parseMessageList("[", &error).has_value());
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_FALSE(parseMessageList(R"({"messages": []})", &error).has_value());
    EXPECT_NE(error.find("lines"), std::string::npos);

    EXPECT_FALSE(parseMessageList(R"([{"id": "a", "role": "grandchild"}])", &error).has_value());
    EXPECT_NE(error.find("role"), std::string::npos);

    EXPECT_FALSE(parseMessageList(R"([{"id": "a", "flags": "unread"}])", &error).has_value());
    EXPECT_FALSE(parseMessageList(R"([{"id": 7}])", &error).has_value());
    EXPECT_FALSE(parseMessageList(R"([42])", &error).has_value());
}

TEST(MessageListParser, MissingFileIsReported)
{
    std::string error;
    auto listing = loadMessageList(std::filesystem::temp_directory_path() / "tfold_missing_listing.json", &error);
    EXPECT_FALSE(listing.has_value());
    EXPECT_NE(error.find("cannot open"), std::string::npos);
}

TEST(MessageList, SetFlagOnlyTouchesMessages)
{
    auto listing = parseMessageList(R"(["header", {"id": "a", "role": "root"}])");
    ASSERT_TRUE(listing.has_value());
    auto &list = listing->messages;

    EXPECT_FALSE(list.setFlag(0, MessageFlag::Unread, true));
    EXPECT_FALSE(list.setFlag(9, MessageFlag::Unread, true));
    EXPECT_TRUE(list.setFlag(1, MessageFlag::Unread, true));
    EXPECT_TRUE(list.messageAt(1)->isUnread());
    EXPECT_TRUE(list.setFlag(1, MessageFlag::Unread, false));
    EXPECT_FALSE(list.messageAt(1)->isUnread());
}

TEST(MarkSet, ToggleReportsNewState)
{
    MarkSet marks;
    EXPECT_TRUE(marks.toggle("a"));
    EXPECT_TRUE(marks.isMarked("a"));
    EXPECT_FALSE(marks.toggle("a"));
    EXPECT_FALSE(marks.unmark("a"));

    marks.mark("b");
    auto query = marks.query();
    EXPECT_TRUE(query("b"));
    EXPECT_FALSE(query("a"));
    marks.clear();
    EXPECT_FALSE(query("b"));
}

TEST(MessageNames, RoleAndFlagNamesParseBack)
{
    for (ThreadRole role : {ThreadRole::Root, ThreadRole::Child, ThreadRole::OrphanFirstChild, ThreadRole::Other})
        EXPECT_EQ(parseThreadRole(threadRoleName(role)), role);
    EXPECT_STREQ(threadRoleName(ThreadRole::OrphanFirstChild), "orphan-first-child");
    EXPECT_FALSE(parseThreadRole("Root").has_value());

    EXPECT_STREQ(messageFlagName(MessageFlag::Unread), "unread");
    EXPECT_EQ(parseMessageFlag("attachment"), MessageFlag::Attachment);
    EXPECT_FALSE(parseMessageFlag("spam").has_value());
}
