#pragma once

#include "tfold/core/message.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace tfold::core
{

/**
 * @brief In-memory listing for hosts without a renderer of their own.
 *
 * Each line carries its display text and, for message lines, the message
 * metadata. Positions are assigned in append order.
 */
class MessageList : public LineSource
{
public:
    std::size_t appendMessage(std::string id, ThreadRole role, MessageFlags flags, std::string text);
    std::size_t appendLine(std::string text);
    void clear() noexcept;

    bool setFlag(std::size_t position, MessageFlag flag, bool on) noexcept;
    std::optional<std::size_t> findMessage(std::string_view id) const noexcept;

    std::size_t lineCount() const noexcept override { return lines_.size(); }
    const Message *messageAt(std::size_t position) const noexcept override;
    std::string_view lineText(std::size_t position) const noexcept override;

private:
    struct Line
    {
        std::string text;
        std::optional<Message> message;
    };

    std::vector<Line> lines_;
};

// Stand-in for the host's marking subsystem.
class MarkSet
{
public:
    void mark(const std::string &messageId);
    bool unmark(const std::string &messageId);
    // Returns the new marked state.
    bool toggle(const std::string &messageId);
    bool isMarked(const std::string &messageId) const;
    void clear() noexcept { ids_.clear(); }
    std::size_t size() const noexcept { return ids_.size(); }

    // The query refers to this set and must not outlive it.
    MarkQuery query() const;

private:
    std::unordered_set<std::string> ids_;
};

struct LoadedListing
{
    MessageList messages;
    MarkSet marks;
};

// Accepts either an array of line objects or {"lines": [...]}. Each line has
// "text" and optionally "id", "role", "flags" and "marked"; lines without an
// "id" carry no message metadata.
std::optional<LoadedListing> parseMessageList(std::string_view text, std::string *error = nullptr);
std::optional<LoadedListing> loadMessageList(const std::filesystem::path &path, std::string *error = nullptr);

} // namespace tfold::core
