#include "tfold/core/fold_session.hpp"

namespace tfold::core
{

const char *foldStateName(FoldState state) noexcept
{
    switch (state)
    {
    case FoldState::Folded:
        return "folded";
    case FoldState::Unfolded:
        return "unfolded";
    }
    return "unknown";
}

FoldSession::FoldSession(bool foldedByDefault) noexcept
    : globalDefault_(foldedByDefault)
{
}

void FoldSession::saveState(const std::string &threadRootId, FoldState state)
{
    overrides_[threadRootId] = state;
}

std::optional<FoldState> FoldSession::lookupState(const std::string &threadRootId) const
{
    auto it = overrides_.find(threadRootId);
    if (it == overrides_.end())
        return std::nullopt;
    return it->second;
}

void FoldSession::resetOverrides() noexcept
{
    overrides_.clear();
}

void FoldSession::reset(bool foldedByDefault) noexcept
{
    overrides_.clear();
    globalDefault_ = foldedByDefault;
}

} // namespace tfold::core
