#include "tfold/core/fold_view.hpp"

#include <algorithm>
#include <unordered_map>

namespace tfold::core
{

std::vector<VisibleRow> visibleRows(const LineSource &source, const RegionSurface &surface)
{
    const std::size_t count = source.lineCount();

    std::vector<FoldRegion> folds;
    for (const auto &annotation : surface.annotations())
    {
        if (FoldRegionStore::isFoldAnnotation(annotation))
            folds.push_back(FoldRegionStore::fromAnnotation(annotation));
    }
    std::sort(folds.begin(), folds.end(),
              [](const FoldRegion &a, const FoldRegion &b) { return a.begin < b.begin; });

    std::unordered_map<std::size_t, const FoldRegion *> byRoot;
    for (const auto &region : folds)
        byRoot[region.rootLine] = &region;

    std::vector<VisibleRow> rows;
    rows.reserve(count);
    auto nextFold = folds.begin();
    std::size_t line = 0;
    while (line < count)
    {
        while (nextFold != folds.end() && nextFold->end <= line)
            ++nextFold;
        if (nextFold != folds.end() && nextFold->contains(line))
        {
            line = nextFold->end;
            continue;
        }

        VisibleRow row;
        row.position = line;
        auto root = byRoot.find(line);
        if (root != byRoot.end())
        {
            row.summary = root->second->summary;
            row.style = root->second->style;
        }
        rows.push_back(std::move(row));
        ++line;
    }
    return rows;
}

std::optional<std::size_t> visibleRowIndex(const std::vector<VisibleRow> &rows, std::size_t position) noexcept
{
    if (rows.empty())
        return std::nullopt;
    auto it = std::upper_bound(rows.begin(), rows.end(), position,
                               [](std::size_t value, const VisibleRow &row) { return value < row.position; });
    if (it == rows.begin())
        return std::nullopt;
    return static_cast<std::size_t>(std::distance(rows.begin(), it) - 1);
}

std::string renderRow(const LineSource &source, const VisibleRow &row)
{
    std::string text(source.lineText(row.position));
    if (row.summary)
    {
        if (!text.empty())
            text.push_back(' ');
        text += *row.summary;
    }
    return text;
}

} // namespace tfold::core
