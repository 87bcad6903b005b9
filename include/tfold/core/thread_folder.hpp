#pragma once

#include "tfold/core/fold_range.hpp"
#include "tfold/core/fold_region.hpp"
#include "tfold/core/fold_session.hpp"
#include "tfold/core/message.hpp"
#include "tfold/core/sequence_cursor.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace tfold::core
{

struct FolderSettings
{
    bool foldUnread = false;
    std::string summaryFormat = std::string(kDefaultSummaryFormat);
    std::string rootStyle = std::string(kDefaultRootStyle);
};

inline constexpr const char *kMarkRefusedNotice = "Cannot mark a message inside a folded thread";

/**
 * @brief User-facing fold operations over one listing.
 *
 * Positions passed in may be any line of a thread; each operation first moves
 * to the thread start. All operations are no-ops at sequence boundaries and on
 * an empty listing. The listing order must stay stable between calls; after it
 * changes, call applyAll() to bring the fold regions back in line with the
 * session state.
 */
class ThreadFolder
{
public:
    using MarkCommand = std::function<void(std::size_t position)>;
    using NoticeCallback = std::function<void(const std::string &message)>;

    ThreadFolder(const LineSource &source, RegionSurface &surface, FoldSession &session,
                 FolderSettings settings = {});

    void setMarkQuery(MarkQuery query) { markQuery_ = std::move(query); }
    void setNoticeCallback(NoticeCallback callback) { noticeCallback_ = std::move(callback); }

    void applySettings(FolderSettings settings);
    const FolderSettings &settings() const noexcept { return settings_; }

    // Navigation
    std::size_t threadRoot(std::size_t position) const noexcept;
    std::optional<std::size_t> previousThread(std::size_t position) const noexcept;
    std::optional<std::size_t> nextThread(std::size_t position) const noexcept;

    std::optional<FoldRegion> isFolded(std::size_t position) const;

    // Return true when a fold region was created or removed.
    bool fold(std::size_t position, bool persist = true);
    bool unfold(std::size_t position, bool persist = true);
    bool toggle(std::size_t position);
    // Toggles, then returns the next thread root (nullopt at the last thread).
    std::optional<std::size_t> toggleAndAdvance(std::size_t position);

    void foldAll();
    void unfoldAll();
    void toggleAll();
    void applyAll();

    bool markAllowed(std::size_t position) const;
    // The returned command refers to this folder and must not outlive it.
    MarkCommand wrapMarkCommand(MarkCommand delegate);
    // Runs delegate on every line of the thread that may be marked. Hidden
    // lines are skipped with a single notice. Returns the number of lines run.
    std::size_t markThread(std::size_t position, const MarkCommand &delegate);

    const SequenceCursor &cursor() const noexcept { return cursor_; }
    const FoldRegionStore &regionStore() const noexcept { return regions_; }
    const FoldSession &session() const noexcept { return session_; }

private:
    void foldEachThread();
    void persistState(std::size_t threadStart, FoldState state);
    void notice(const std::string &message) const;

    const LineSource &source_;
    SequenceCursor cursor_;
    FoldRegionStore regions_;
    FoldSession &session_;
    FolderSettings settings_;
    MarkQuery markQuery_;
    NoticeCallback noticeCallback_;
};

} // namespace tfold::core
