#include "tfold/core/sequence_cursor.hpp"

namespace tfold::core
{

SequenceCursor::SequenceCursor(const LineSource &source) noexcept
    : source(source)
{
}

std::size_t SequenceCursor::size() const noexcept
{
    return source.lineCount();
}

bool SequenceCursor::isThreadRoot(std::size_t position) const noexcept
{
    if (position >= source.lineCount())
        return false;
    const Message *message = source.messageAt(position);
    if (!message)
        return false;
    return message->threadRole == ThreadRole::Root || message->threadRole == ThreadRole::OrphanFirstChild;
}

std::size_t SequenceCursor::findThreadStart(std::size_t position) const noexcept
{
    const std::size_t count = source.lineCount();
    if (count == 0)
        return 0;
    if (position >= count)
        position = count - 1;
    while (position > 0 && !isThreadRoot(position))
        --position;
    return position;
}

std::optional<std::size_t> SequenceCursor::findNextThreadStart(std::size_t position) const noexcept
{
    const std::size_t count = source.lineCount();
    for (std::size_t line = position + 1; line < count; ++line)
    {
        if (isThreadRoot(line))
            return line;
    }
    return std::nullopt;
}

std::optional<std::size_t> SequenceCursor::findPrevThreadStart(std::size_t position) const noexcept
{
    if (source.lineCount() == 0)
        return std::nullopt;
    std::size_t start = findThreadStart(position);
    if (start == 0)
        return std::nullopt;
    return findThreadStart(start - 1);
}

std::size_t SequenceCursor::threadEnd(std::size_t threadStart) const noexcept
{
    return findNextThreadStart(threadStart).value_or(source.lineCount());
}

} // namespace tfold::core
