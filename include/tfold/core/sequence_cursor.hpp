#pragma once

#include "tfold/core/message.hpp"

#include <cstddef>
#include <optional>

namespace tfold::core
{

/**
 * @brief Thread boundary primitives over a LineSource.
 *
 * A thread is the half-open range [root, nextRoot). Threads are never
 * materialised; every query scans from the given position and costs at most
 * the length of the thread it lands in.
 */
class SequenceCursor
{
public:
    explicit SequenceCursor(const LineSource &source) noexcept;

    std::size_t size() const noexcept;

    // Root or orphan-first-child. Lines without metadata are never roots.
    bool isThreadRoot(std::size_t position) const noexcept;

    // Scans backwards, inclusive. Falls back to the start of the sequence.
    std::size_t findThreadStart(std::size_t position) const noexcept;

    // Next root after position, or nullopt when the thread runs to the end.
    std::optional<std::size_t> findNextThreadStart(std::size_t position) const noexcept;

    // Root of the preceding thread, or nullopt when already in the first one.
    std::optional<std::size_t> findPrevThreadStart(std::size_t position) const noexcept;

    // Exclusive end of the thread starting at threadStart.
    std::size_t threadEnd(std::size_t threadStart) const noexcept;

private:
    const LineSource &source;
};

} // namespace tfold::core
