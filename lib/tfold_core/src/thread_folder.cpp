#include "tfold/core/thread_folder.hpp"

#include "tfold/logging.hpp"

namespace tfold::core
{

ThreadFolder::ThreadFolder(const LineSource &source, RegionSurface &surface, FoldSession &session,
                           FolderSettings settings)
    : source_(source), cursor_(source), regions_(surface, settings.summaryFormat, settings.rootStyle),
      session_(session), settings_(std::move(settings))
{
}

void ThreadFolder::applySettings(FolderSettings settings)
{
    settings_ = std::move(settings);
    regions_.setSummaryFormat(settings_.summaryFormat);
    regions_.setRootStyle(settings_.rootStyle);
}

std::size_t ThreadFolder::threadRoot(std::size_t position) const noexcept
{
    return cursor_.findThreadStart(position);
}

std::optional<std::size_t> ThreadFolder::previousThread(std::size_t position) const noexcept
{
    return cursor_.findPrevThreadStart(position);
}

std::optional<std::size_t> ThreadFolder::nextThread(std::size_t position) const noexcept
{
    if (cursor_.size() == 0)
        return std::nullopt;
    return cursor_.findNextThreadStart(cursor_.findThreadStart(position));
}

std::optional<FoldRegion> ThreadFolder::isFolded(std::size_t position) const
{
    if (cursor_.size() == 0)
        return std::nullopt;
    const std::size_t start = cursor_.findThreadStart(position);
    return regions_.isFolded(start, cursor_.threadEnd(start));
}

bool ThreadFolder::fold(std::size_t position, bool persist)
{
    if (cursor_.size() == 0)
        return false;
    const std::size_t start = cursor_.findThreadStart(position);
    const std::size_t end = cursor_.threadEnd(start);
    if (regions_.isFolded(start, end))
        return false;

    bool created = false;
    if (auto range = computeFoldRange(source_, start, end, settings_.foldUnread, markQuery_))
    {
        if (auto region = regions_.create(start, *range))
        {
            created = true;
            logging::logger()->debug("Folded lines [{}, {}) under thread at {}", region->begin, region->end, start);
        }
    }
    if (persist)
        persistState(start, FoldState::Folded);
    return created;
}

bool ThreadFolder::unfold(std::size_t position, bool persist)
{
    const std::size_t count = cursor_.size();
    if (count == 0)
        return false;
    const std::size_t start = cursor_.findThreadStart(position);
    if (start + 1 >= count)
        return false;

    auto region = regions_.isFolded(start, cursor_.threadEnd(start));
    if (!region)
        return false;
    const bool removed = regions_.remove(*region);
    if (removed)
        logging::logger()->debug("Unfolded lines [{}, {}) under thread at {}", region->begin, region->end, start);
    if (persist)
        persistState(start, FoldState::Unfolded);
    return removed;
}

bool ThreadFolder::toggle(std::size_t position)
{
    if (isFolded(position))
        return unfold(position);
    return fold(position);
}

std::optional<std::size_t> ThreadFolder::toggleAndAdvance(std::size_t position)
{
    if (cursor_.size() == 0)
        return std::nullopt;
    toggle(position);
    return nextThread(position);
}

void ThreadFolder::foldAll()
{
    session_.resetOverrides();
    session_.setGlobalDefault(true);
    foldEachThread();
    logging::logger()->info("Folded all threads ({} regions)", regions_.regions().size());
}

void ThreadFolder::unfoldAll()
{
    session_.resetOverrides();
    session_.setGlobalDefault(false);
    const std::size_t removed = regions_.removeAll();
    logging::logger()->info("Unfolded all threads ({} regions removed)", removed);
}

void ThreadFolder::toggleAll()
{
    if (session_.globalDefault())
        unfoldAll();
    else
        foldAll();
}

void ThreadFolder::applyAll()
{
    if (session_.globalDefault())
        foldEachThread();
    else
        regions_.removeAll();

    if (!session_.hasOverrides() || cursor_.size() == 0)
        return;

    std::size_t applied = 0;
    std::size_t start = 0;
    while (true)
    {
        const Message *message = source_.messageAt(start);
        if (message && !message->id.empty())
        {
            if (auto state = session_.lookupState(message->id))
            {
                if (*state == FoldState::Folded)
                    fold(start, false);
                else
                    unfold(start, false);
                ++applied;
            }
        }
        auto next = cursor_.findNextThreadStart(start);
        if (!next)
            break;
        start = *next;
    }
    logging::logger()->debug("Reapplied {} of {} thread overrides", applied, session_.overrideCount());
}

bool ThreadFolder::markAllowed(std::size_t position) const
{
    return !regions_.regionContaining(position).has_value();
}

ThreadFolder::MarkCommand ThreadFolder::wrapMarkCommand(MarkCommand delegate)
{
    return [this, delegate = std::move(delegate)](std::size_t position) {
        if (!markAllowed(position))
        {
            notice(kMarkRefusedNotice);
            return;
        }
        if (delegate)
            delegate(position);
    };
}

std::size_t ThreadFolder::markThread(std::size_t position, const MarkCommand &delegate)
{
    if (cursor_.size() == 0 || !delegate)
        return 0;
    const std::size_t start = cursor_.findThreadStart(position);
    const std::size_t end = cursor_.threadEnd(start);

    std::size_t marked = 0;
    std::size_t refused = 0;
    for (std::size_t line = start; line < end; ++line)
    {
        if (!markAllowed(line))
        {
            ++refused;
            continue;
        }
        delegate(line);
        ++marked;
    }
    if (refused > 0)
    {
        logging::logger()->debug("Skipped {} hidden lines while marking thread at {}", refused, start);
        notice(kMarkRefusedNotice);
    }
    return marked;
}

void ThreadFolder::foldEachThread()
{
    if (cursor_.size() == 0)
        return;
    std::size_t start = 0;
    while (true)
    {
        fold(start, false);
        auto next = cursor_.findNextThreadStart(start);
        if (!next)
            break;
        start = *next;
    }
}

void ThreadFolder::persistState(std::size_t threadStart, FoldState state)
{
    const Message *root = source_.messageAt(threadStart);
    if (!root || root->id.empty())
    {
        logging::logger()->debug("Thread at {} has no root id; {} state not recorded", threadStart,
                                 foldStateName(state));
        return;
    }
    session_.saveState(root->id, state);
}

void ThreadFolder::notice(const std::string &message) const
{
    logging::logger()->info("{}", message);
    if (noticeCallback_)
        noticeCallback_(message);
}

} // namespace tfold::core
