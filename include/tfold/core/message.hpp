#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tfold::core
{

enum class MessageFlag : std::uint8_t
{
    Unread = 1u << 0,
    Flagged = 1u << 1,
    Replied = 1u << 2,
    Attachment = 1u << 3,
    Deleted = 1u << 4
};

class MessageFlags
{
public:
    constexpr MessageFlags() noexcept = default;
    constexpr MessageFlags(MessageFlag flag) noexcept
        : bits(static_cast<std::uint8_t>(flag))
    {
    }

    constexpr bool contains(MessageFlag flag) const noexcept
    {
        return (bits & static_cast<std::uint8_t>(flag)) != 0;
    }
    constexpr bool empty() const noexcept { return bits == 0; }

    void insert(MessageFlag flag) noexcept { bits |= static_cast<std::uint8_t>(flag); }
    void erase(MessageFlag flag) noexcept { bits &= static_cast<std::uint8_t>(~static_cast<std::uint8_t>(flag)); }
    void set(MessageFlag flag, bool on) noexcept
    {
        if (on)
            insert(flag);
        else
            erase(flag);
    }

    constexpr MessageFlags operator|(MessageFlags other) const noexcept
    {
        MessageFlags result;
        result.bits = static_cast<std::uint8_t>(bits | other.bits);
        return result;
    }

    constexpr bool operator==(const MessageFlags &other) const noexcept { return bits == other.bits; }
    constexpr bool operator!=(const MessageFlags &other) const noexcept { return bits != other.bits; }

private:
    std::uint8_t bits = 0;
};

constexpr MessageFlags operator|(MessageFlag lhs, MessageFlag rhs) noexcept
{
    return MessageFlags(lhs) | MessageFlags(rhs);
}

enum class ThreadRole
{
    Root,
    Child,
    OrphanFirstChild,
    Other
};

// Per-line metadata attached by the renderer. Read-only to the engine.
struct Message
{
    std::string id;
    std::size_t position = 0;
    MessageFlags flags;
    ThreadRole threadRole = ThreadRole::Other;

    bool isUnread() const noexcept { return flags.contains(MessageFlag::Unread); }
};

/**
 * @brief Ordered, line-addressed view over a rendered message listing.
 *
 * Implemented by whatever produces the listing. Lines that are not messages
 * (headers, footers, separators) report no metadata.
 */
class LineSource
{
public:
    virtual ~LineSource() = default;

    virtual std::size_t lineCount() const noexcept = 0;
    virtual const Message *messageAt(std::size_t position) const noexcept = 0;
    virtual std::string_view lineText(std::size_t position) const noexcept = 0;
};

// Answers "is this message currently marked". An empty query marks nothing.
using MarkQuery = std::function<bool(const std::string &messageId)>;

const char *threadRoleName(ThreadRole role) noexcept;
std::optional<ThreadRole> parseThreadRole(std::string_view name) noexcept;

const char *messageFlagName(MessageFlag flag) noexcept;
std::optional<MessageFlag> parseMessageFlag(std::string_view name) noexcept;

} // namespace tfold::core
