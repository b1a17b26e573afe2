#pragma once

#include "pageflow/measurement_view.h"
#include <optional>
#include <vector>

namespace pageflow {

/// A break inside a table row. `top`/`bottom` are surface coordinates.
struct RowBreak {
    int pos = 0;
    float top = 0;
    float bottom = 0;
};

/// First table row crossing a boundary and where it breaks
struct TableRowOverflow {
    RowBreak breakInfo;
    std::vector<RowBreak> rowBreaks;
    int rowPos = 0;                  // Position before the overflowing row
    std::optional<Rect> rowRect;
    std::optional<float> rowTop;
    std::optional<float> rowBottom;
    float boundary = 0;
};

/// Position whose caret top is closest to a target Y
struct YSearchResult {
    int pos = 0;
    std::optional<Rect> coords;      // Caret rect of the closest position, before rewinding
};

/// Find the first table row at or after `startPos` whose bottom passes the
/// absolute `boundary` and refine its break: per cell first, then for the row
/// as a whole (keeping the earlier position), then by binary search when
/// neither moved past the row start. Unrefined rows break at their start.
std::optional<TableRowOverflow> findTableRowOverflow(const MeasurementView& view,
                                                     int startPos,
                                                     float boundary);

/// Binary search [startPos, endPos] for the position whose caret top is
/// nearest `targetY`, then rewind to the start of its visual line.
/// The returned coords belong to the nearest position, not the rewound one.
std::optional<YSearchResult> binarySearchForYPosition(const MeasurementView& view,
                                                      int startPos,
                                                      int endPos,
                                                      float targetY,
                                                      int maxIterations = 22);

/// Positions where the renderer paints the gap after a page.
/// A break inside a table cell yields one marker per cell of that row, at
/// the row's break line (or the cell end for shorter cells), sorted.
/// Anything else yields the clamped break position alone.
std::vector<int> deriveSpacingSegments(const MeasurementView& view,
                                       int basePos,
                                       std::optional<float> breakY);

} // namespace pageflow
