#include "tfold/core/message_list.hpp"

#include "tfold/logging.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace tfold::core
{
namespace
{

void setError(std::string *error, std::string message)
{
    if (error)
        *error = std::move(message);
}

std::string lineTextFrom(const nlohmann::json &entry)
{
    if (entry.contains("text") && entry["text"].is_string())
        return entry["text"].get<std::string>();
    std::string text;
    if (entry.contains("from") && entry["from"].is_string())
        text = entry["from"].get<std::string>();
    if (entry.contains("subject") && entry["subject"].is_string())
    {
        if (!text.empty())
            text += "  ";
        text += entry["subject"].get<std::string>();
    }
    return text;
}

bool appendEntry(LoadedListing &listing, const nlohmann::json &entry, std::size_t index, std::string *error)
{
    if (entry.is_string())
    {
        listing.messages.appendLine(entry.get<std::string>());
        return true;
    }
    if (!entry.is_object())
    {
        setError(error, "line " + std::to_string(index) + " is not an object");
        return false;
    }

    std::string text = lineTextFrom(entry);
    if (!entry.contains("id") || entry["id"].is_null())
    {
        listing.messages.appendLine(std::move(text));
        return true;
    }
    if (!entry["id"].is_string())
    {
        setError(error, "line " + std::to_string(index) + " has a non-string id");
        return false;
    }
    std::string id = entry["id"].get<std::string>();

    ThreadRole role = ThreadRole::Child;
    if (entry.contains("role"))
    {
        const auto &roleValue = entry["role"];
        std::optional<ThreadRole> parsed;
        if (roleValue.is_string())
            parsed = parseThreadRole(roleValue.get<std::string>());
        if (!parsed)
        {
            setError(error, "line " + std::to_string(index) + " has an unknown role");
            return false;
        }
        role = *parsed;
    }

    MessageFlags flags;
    if (entry.contains("flags"))
    {
        const auto &flagValues = entry["flags"];
        if (!flagValues.is_array())
        {
            setError(error, "line " + std::to_string(index) + " flags must be an array");
            return false;
        }
        for (const auto &flagValue : flagValues)
        {
            if (!flagValue.is_string())
                continue;
            // Flags the engine does not know about are carried by the host only.
            if (auto flag = parseMessageFlag(flagValue.get<std::string>()))
                flags.insert(*flag);
        }
    }

    if (text.empty())
        text = id;
    if (entry.contains("marked") && entry["marked"].is_boolean() && entry["marked"].get<bool>())
        listing.marks.mark(id);
    listing.messages.appendMessage(std::move(id), role, flags, std::move(text));
    return true;
}

} // namespace

std::size_t MessageList::appendMessage(std::string id, ThreadRole role, MessageFlags flags, std::string text)
{
    const std::size_t position = lines_.size();
    Message message;
    message.id = std::move(id);
    message.position = position;
    message.flags = flags;
    message.threadRole = role;
    lines_.push_back(Line{std::move(text), std::move(message)});
    return position;
}

std::size_t MessageList::appendLine(std::string text)
{
    const std::size_t position = lines_.size();
    lines_.push_back(Line{std::move(text), std::nullopt});
    return position;
}

void MessageList::clear() noexcept
{
    lines_.clear();
}

bool MessageList::setFlag(std::size_t position, MessageFlag flag, bool on) noexcept
{
    if (position >= lines_.size() || !lines_[position].message)
        return false;
    lines_[position].message->flags.set(flag, on);
    return true;
}

std::optional<std::size_t> MessageList::findMessage(std::string_view id) const noexcept
{
    for (std::size_t i = 0; i < lines_.size(); ++i)
    {
        if (lines_[i].message && lines_[i].message->id == id)
            return i;
    }
    return std::nullopt;
}

const Message *MessageList::messageAt(std::size_t position) const noexcept
{
    if (position >= lines_.size() || !lines_[position].message)
        return nullptr;
    return &*lines_[position].message;
}

std::string_view MessageList::lineText(std::size_t position) const noexcept
{
    if (position >= lines_.size())
        return {};
    return lines_[position].text;
}

void MarkSet::mark(const std::string &messageId)
{
    ids_.insert(messageId);
}

bool MarkSet::unmark(const std::string &messageId)
{
    return ids_.erase(messageId) > 0;
}

bool MarkSet::toggle(const std::string &messageId)
{
    if (unmark(messageId))
        return false;
    mark(messageId);
    return true;
}

bool MarkSet::isMarked(const std::string &messageId) const
{
    return ids_.find(messageId) != ids_.end();
}

MarkQuery MarkSet::query() const
{
    return [this](const std::string &messageId) { return isMarked(messageId); };
}

std::optional<LoadedListing> parseMessageList(std::string_view text, std::string *error)
{
    nlohmann::json data;
    try
    {
        data = nlohmann::json::parse(text.begin(), text.end());
    }
    catch (const nlohmann::json::exception &ex)
    {
        setError(error, ex.what());
        return std::nullopt;
    }

    const nlohmann::json *lines = &data;
    if (data.is_object())
    {
        if (!data.contains("lines"))
        {
            setError(error, "missing \"lines\" array");
            return std::nullopt;
        }
        lines = &data["lines"];
    }
    if (!lines->is_array())
    {
        setError(error, "expected an array of lines");
        return std::nullopt;
    }

    LoadedListing listing;
    std::size_t index = 0;
    for (const auto &entry : *lines)
    {
        if (!appendEntry(listing, entry, index, error))
            return std::nullopt;
        ++index;
    }
    return listing;
}

std::optional<LoadedListing> loadMessageList(const std::filesystem::path &path, std::string *error)
{
    std::ifstream in(path);
    if (!in)
    {
        setError(error, "cannot open " + path.string());
        logging::logger()->warn("Cannot open message list {}", path.string());
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    std::string reason;
    auto listing = parseMessageList(buffer.str(), &reason);
    if (!listing)
    {
        logging::logger()->warn("Unreadable message list {}: {}", path.string(), reason);
        setError(error, std::move(reason));
        return std::nullopt;
    }
    logging::logger()->debug("Loaded {} lines from {}", listing->messages.lineCount(), path.string());
    return listing;
}

} // namespace tfold::core
