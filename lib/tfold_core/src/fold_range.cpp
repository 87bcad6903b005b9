#include "tfold/core/fold_range.hpp"

#include <algorithm>

namespace tfold::core
{

std::optional<FoldRange> computeFoldRange(const LineSource &source,
                                          std::size_t threadStart,
                                          std::size_t threadEnd,
                                          bool foldUnread,
                                          const MarkQuery &isMarked)
{
    threadEnd = std::min(threadEnd, source.lineCount());
    if (threadStart + 1 >= threadEnd)
        return std::nullopt;

    FoldRange range;
    range.begin = threadStart + 1;

    std::size_t line = range.begin;
    while (line < threadEnd)
    {
        const Message *message = source.messageAt(line);
        if (!message)
            break;
        if (isMarked && isMarked(message->id))
            break;
        if (message->isUnread())
        {
            ++range.unreadCount;
            if (!foldUnread)
                break;
        }
        ++line;
    }

    range.end = line;
    range.hiddenCount = range.end - range.begin;
    if (!foldUnread)
        range.unreadCount = 0;
    return range;
}

} // namespace tfold::core
