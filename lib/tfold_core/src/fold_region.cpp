#include "tfold/core/fold_region.hpp"

#include <algorithm>

namespace tfold::core
{
namespace
{

void replaceAll(std::string &text, std::string_view token, const std::string &value)
{
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos)
    {
        text.replace(pos, token.size(), value);
        pos += value.size();
    }
}

} // namespace

AnnotationHandle MemoryRegionSurface::attach(Annotation annotation)
{
    if (annotation.end < annotation.begin)
        std::swap(annotation.begin, annotation.end);
    annotation.handle = nextHandle_++;
    maxSpan_ = std::max(maxSpan_, annotation.end - annotation.begin);
    const AnnotationHandle handle = annotation.handle;
    auto it = entries_.emplace(annotation.begin, std::move(annotation));
    byHandle_.emplace(handle, it);
    return handle;
}

bool MemoryRegionSurface::detach(AnnotationHandle handle)
{
    auto it = byHandle_.find(handle);
    if (it == byHandle_.end())
        return false;
    entries_.erase(it->second);
    byHandle_.erase(it);
    if (entries_.empty())
        maxSpan_ = 0;
    return true;
}

std::vector<Annotation> MemoryRegionSurface::overlapping(std::size_t begin, std::size_t end) const
{
    std::vector<Annotation> result;
    if (end <= begin)
        return result;
    // Nothing starting earlier than begin - maxSpan_ can reach into the range.
    const std::size_t from = begin > maxSpan_ ? begin - maxSpan_ : 0;
    for (auto it = entries_.lower_bound(from); it != entries_.end() && it->first < end; ++it)
    {
        const Annotation &annotation = it->second;
        if (annotation.end > begin)
            result.push_back(annotation);
    }
    return result;
}

void MemoryRegionSurface::clear() noexcept
{
    byHandle_.clear();
    entries_.clear();
    maxSpan_ = 0;
}

std::vector<Annotation> MemoryRegionSurface::annotations() const
{
    std::vector<Annotation> result;
    result.reserve(entries_.size());
    for (const auto &[begin, annotation] : entries_)
    {
        (void)begin;
        result.push_back(annotation);
    }
    return result;
}

std::string formatFoldSummary(std::string_view format, std::size_t hidden, std::size_t unread)
{
    std::string text(format);
    replaceAll(text, "{hidden}", std::to_string(hidden));
    replaceAll(text, "{unread}", std::to_string(unread));
    return text;
}

FoldRegionStore::FoldRegionStore(RegionSurface &surface, std::string summaryFormat, std::string rootStyle)
    : surface_(surface), summaryFormat_(std::move(summaryFormat)), rootStyle_(std::move(rootStyle))
{
}

bool FoldRegionStore::isFoldAnnotation(const Annotation &annotation) noexcept
{
    return annotation.tag == kFoldRegionTag;
}

FoldRegion FoldRegionStore::fromAnnotation(const Annotation &annotation)
{
    FoldRegion region;
    region.handle = annotation.handle;
    region.rootLine = annotation.styledLine;
    region.begin = annotation.begin;
    region.end = annotation.end;
    region.summary = annotation.text;
    region.style = annotation.style;
    return region;
}

std::optional<FoldRegion> FoldRegionStore::isFolded(std::size_t threadStart, std::size_t threadEnd) const
{
    for (const auto &annotation : surface_.overlapping(threadStart, threadEnd))
    {
        if (isFoldAnnotation(annotation))
            return fromAnnotation(annotation);
    }
    return std::nullopt;
}

std::optional<FoldRegion> FoldRegionStore::create(std::size_t rootLine, const FoldRange &range)
{
    if (range.hiddenCount <= 1)
        return std::nullopt;

    Annotation annotation;
    annotation.begin = range.begin;
    annotation.end = range.end;
    annotation.tag = std::string(kFoldRegionTag);
    annotation.text = formatFoldSummary(summaryFormat_, range.hiddenCount, range.unreadCount);
    annotation.styledLine = rootLine;
    annotation.style = rootStyle_;
    annotation.handle = surface_.attach(annotation);
    return fromAnnotation(annotation);
}

bool FoldRegionStore::remove(const FoldRegion &region)
{
    return surface_.detach(region.handle);
}

std::size_t FoldRegionStore::removeAll()
{
    std::size_t removed = 0;
    for (const auto &annotation : surface_.annotations())
    {
        if (isFoldAnnotation(annotation) && surface_.detach(annotation.handle))
            ++removed;
    }
    return removed;
}

std::optional<FoldRegion> FoldRegionStore::regionContaining(std::size_t position) const
{
    for (const auto &annotation : surface_.overlapping(position, position + 1))
    {
        if (isFoldAnnotation(annotation))
            return fromAnnotation(annotation);
    }
    return std::nullopt;
}

std::vector<FoldRegion> FoldRegionStore::regions() const
{
    std::vector<FoldRegion> result;
    for (const auto &annotation : surface_.annotations())
    {
        if (isFoldAnnotation(annotation))
            result.push_back(fromAnnotation(annotation));
    }
    return result;
}

} // namespace tfold::core
