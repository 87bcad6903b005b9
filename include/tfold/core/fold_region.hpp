#pragma once

#include "tfold/core/fold_range.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tfold::core
{

using AnnotationHandle = std::uint64_t;

// A renderable annotation over the half-open line range [begin, end).
struct Annotation
{
    AnnotationHandle handle = 0;
    std::size_t begin = 0;
    std::size_t end = 0;
    std::string tag;
    std::string text;
    std::size_t styledLine = 0;
    std::string style;
};

/**
 * @brief Rendering surface able to carry line-range annotations.
 *
 * A terminal list view, a GUI list model or the in-memory surface below can
 * implement it. Surfaces may hold annotations that have nothing to do with
 * folding; consumers filter by tag.
 */
class RegionSurface
{
public:
    virtual ~RegionSurface() = default;

    virtual AnnotationHandle attach(Annotation annotation) = 0;
    // Returns false when the handle is no longer attached.
    virtual bool detach(AnnotationHandle handle) = 0;
    virtual std::vector<Annotation> overlapping(std::size_t begin, std::size_t end) const = 0;
    virtual std::vector<Annotation> annotations() const = 0;
};

// The handle index points into the entry tree, so a surface is not copyable.
class MemoryRegionSurface : public RegionSurface
{
public:
    MemoryRegionSurface() = default;
    MemoryRegionSurface(const MemoryRegionSurface &) = delete;
    MemoryRegionSurface &operator=(const MemoryRegionSurface &) = delete;

    AnnotationHandle attach(Annotation annotation) override;
    bool detach(AnnotationHandle handle) override;
    std::vector<Annotation> overlapping(std::size_t begin, std::size_t end) const override;
    std::vector<Annotation> annotations() const override;

    void clear() noexcept;
    std::size_t size() const noexcept { return byHandle_.size(); }
    bool empty() const noexcept { return byHandle_.empty(); }

private:
    using Entries = std::multimap<std::size_t, Annotation>;

    Entries entries_;
    std::unordered_map<AnnotationHandle, Entries::iterator> byHandle_;
    AnnotationHandle nextHandle_ = 1;
    std::size_t maxSpan_ = 0;
};

struct FoldRegion
{
    AnnotationHandle handle = 0;
    std::size_t rootLine = 0;
    std::size_t begin = 0;
    std::size_t end = 0;
    std::string summary;
    std::string style;

    std::size_t hiddenCount() const noexcept { return end - begin; }
    bool contains(std::size_t position) const noexcept { return position >= begin && position < end; }
};

inline constexpr std::string_view kFoldRegionTag = "tfold-fold";
inline constexpr std::string_view kDefaultSummaryFormat = "[{hidden} hidden messages, {unread} unread]";
inline constexpr std::string_view kDefaultRootStyle = "thread-folded";

// Expands {hidden} and {unread} in format.
std::string formatFoldSummary(std::string_view format, std::size_t hidden, std::size_t unread);

/**
 * @brief Fold regions as tagged annotations on a RegionSurface.
 *
 * At most one fold region exists per thread; callers check isFolded() before
 * creating one.
 */
class FoldRegionStore
{
public:
    explicit FoldRegionStore(RegionSurface &surface,
                             std::string summaryFormat = std::string(kDefaultSummaryFormat),
                             std::string rootStyle = std::string(kDefaultRootStyle));

    std::optional<FoldRegion> isFolded(std::size_t threadStart, std::size_t threadEnd) const;
    // Creates nothing when fewer than two lines would be hidden.
    std::optional<FoldRegion> create(std::size_t rootLine, const FoldRange &range);
    // Idempotent; returns false when the region was already gone.
    bool remove(const FoldRegion &region);
    std::size_t removeAll();

    std::optional<FoldRegion> regionContaining(std::size_t position) const;
    std::vector<FoldRegion> regions() const;

    void setSummaryFormat(std::string format) { summaryFormat_ = std::move(format); }
    const std::string &summaryFormat() const noexcept { return summaryFormat_; }
    void setRootStyle(std::string style) { rootStyle_ = std::move(style); }
    const std::string &rootStyle() const noexcept { return rootStyle_; }

    static bool isFoldAnnotation(const Annotation &annotation) noexcept;
    static FoldRegion fromAnnotation(const Annotation &annotation);

private:
    RegionSurface &surface_;
    std::string summaryFormat_;
    std::string rootStyle_;
};

} // namespace tfold::core
