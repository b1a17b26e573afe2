#pragma once

#include "pageflow/measurement_view.h"
#include <optional>

namespace pageflow {

/// Where an overflowing block breaks.
/// `fittedTop`/`fittedBottom` are relative to the container top and clamped
/// so that pageStart <= fittedTop <= fittedBottom <= pageLimit.
/// `breakY` is the absolute, unclamped surface Y of the break.
struct BreakResult {
    float fittedTop = 0;
    float fittedBottom = 0;
    int pos = 0;
    float breakY = 0;
};

/// The part of the pagination state a break search reads
struct BreakSearchBounds {
    float pageStartPx = 0;
    int lastBreakPos = 0;
};

/// Locate the exact break inside a top-level block crossing `pageLimit`
/// (relative to the container top).
///
/// The block's document position comes from the element, or from a hit test
/// at its lower-left corner. Blocks with block children are searched
/// recursively; others are split inside their inline content. Returns
/// nullopt when the block cannot be mapped to the document.
std::optional<BreakResult> getExactBreakPosition(const MeasurementView& view,
                                                 ElementHandle block,
                                                 const Rect& containerRect,
                                                 float pageLimit,
                                                 const BreakSearchBounds& bounds);

/// Walk the children of a container node and break inside the first one
/// that straddles `absoluteBoundary`. A straddling container whose content
/// does not straddle (padding overflow) is pushed whole to the next page.
std::optional<BreakResult> findBreakInBlockContainer(const MeasurementView& view,
                                                     int containerPos,
                                                     const DocNode& containerNode,
                                                     float absoluteBoundary,
                                                     const Rect& containerRect,
                                                     const BreakSearchBounds& bounds);

/// Break inside a leaf block and convert the result to clamped page-relative
/// coordinates. Missing coordinates fall back to the caret rect at the
/// position, then to `blockRect`, then to the container top.
BreakResult findAndNormalizeBreakResult(const MeasurementView& view,
                                        int pos,
                                        const DocNode* node,
                                        float absoluteBoundary,
                                        int lastBreakBase,
                                        const Rect& containerRect,
                                        const BreakSearchBounds& bounds,
                                        const std::optional<Rect>& blockRect = std::nullopt);

/// True for table row node types
bool isTableRowType(const std::string& type);

/// True for table cell node types
bool isTableCellType(const std::string& type);

} // namespace pageflow
