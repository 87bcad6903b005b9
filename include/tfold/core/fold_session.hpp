#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace tfold::core
{

enum class FoldState
{
    Folded,
    Unfolded
};

const char *foldStateName(FoldState state) noexcept;

/**
 * @brief Fold state for one listing session.
 *
 * Holds the global default ("unspecified threads appear folded") and the
 * per-thread overrides keyed by root message id. Overrides are only recorded
 * for individual choices; the unconditional global operations clear them.
 */
class FoldSession
{
public:
    explicit FoldSession(bool foldedByDefault = false) noexcept;

    void saveState(const std::string &threadRootId, FoldState state);
    std::optional<FoldState> lookupState(const std::string &threadRootId) const;
    void resetOverrides() noexcept;

    bool globalDefault() const noexcept { return globalDefault_; }
    void setGlobalDefault(bool folded) noexcept { globalDefault_ = folded; }
    FoldState defaultState() const noexcept { return globalDefault_ ? FoldState::Folded : FoldState::Unfolded; }

    std::size_t overrideCount() const noexcept { return overrides_.size(); }
    bool hasOverrides() const noexcept { return !overrides_.empty(); }

    // Back to the state a fresh session would have.
    void reset(bool foldedByDefault = false) noexcept;

private:
    bool globalDefault_ = false;
    std::unordered_map<std::string, FoldState> overrides_;
};

} // namespace tfold::core
