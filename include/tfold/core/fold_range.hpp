#pragma once

#include "tfold/core/message.hpp"

#include <cstddef>
#include <optional>

namespace tfold::core
{

struct FoldRange
{
    std::size_t begin = 0; // first hidden line
    std::size_t end = 0;   // first line after the hidden block
    std::size_t hiddenCount = 0;
    std::size_t unreadCount = 0;
};

/**
 * @brief Decides which descendant lines of a thread may be hidden.
 *
 * The scan starts on the line after the root and stops at the thread end, at
 * the first line without message metadata, at the first marked message, and
 * (unless foldUnread is set) at the first unread message. The stopping line is
 * never hidden. Marked takes precedence over unread when a message is both.
 *
 * Returns nullopt when the thread consists of its root line only.
 */
std::optional<FoldRange> computeFoldRange(const LineSource &source,
                                          std::size_t threadStart,
                                          std::size_t threadEnd,
                                          bool foldUnread,
                                          const MarkQuery &isMarked);

} // namespace tfold::core
