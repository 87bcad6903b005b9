#include "tfold/core/message.hpp"

#include <array>
#include <utility>

namespace tfold::core
{
namespace
{

constexpr std::array<std::pair<ThreadRole, std::string_view>, 4> kRoleNames{{
    {ThreadRole::Root, "root"},
    {ThreadRole::Child, "child"},
    {ThreadRole::OrphanFirstChild, "orphan-first-child"},
    {ThreadRole::Other, "other"},
}};

constexpr std::array<std::pair<MessageFlag, std::string_view>, 5> kFlagNames{{
    {MessageFlag::Unread, "unread"},
    {MessageFlag::Flagged, "flagged"},
    {MessageFlag::Replied, "replied"},
    {MessageFlag::Attachment, "attachment"},
    {MessageFlag::Deleted, "deleted"},
}};

} // namespace

const char *threadRoleName(ThreadRole role) noexcept
{
    for (const auto &[value, name] : kRoleNames)
    {
        if (value == role)
            return name.data();
    }
    return "other";
}

std::optional<ThreadRole> parseThreadRole(std::string_view name) noexcept
{
    for (const auto &[value, label] : kRoleNames)
    {
        if (label == name)
            return value;
    }
    return std::nullopt;
}

const char *messageFlagName(MessageFlag flag) noexcept
{
    for (const auto &[value, name] : kFlagNames)
    {
        if (value == flag)
            return name.data();
    }
    return "";
}

std::optional<MessageFlag> parseMessageFlag(std::string_view name) noexcept
{
    for (const auto &[value, label] : kFlagNames)
    {
        if (label == name)
            return value;
    }
    return std::nullopt;
}

} // namespace tfold::core
