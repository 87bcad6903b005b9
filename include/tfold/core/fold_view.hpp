#pragma once

#include "tfold/core/fold_region.hpp"
#include "tfold/core/message.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tfold::core
{

struct VisibleRow
{
    std::size_t position = 0;
    // Set on the root line of a folded thread.
    std::optional<std::string> summary;
    std::string style;
};

// The lines a list view shows: everything except lines inside fold regions.
std::vector<VisibleRow> visibleRows(const LineSource &source, const RegionSurface &surface);

// Row showing position, or the row of the fold root hiding it.
std::optional<std::size_t> visibleRowIndex(const std::vector<VisibleRow> &rows, std::size_t position) noexcept;

std::string renderRow(const LineSource &source, const VisibleRow &row);

} // namespace tfold::core
