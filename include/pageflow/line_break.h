#pragma once

#include "pageflow/measurement_view.h"
#include <optional>
#include <vector>

namespace pageflow {

/// Vertical tolerance when grouping rects into visual lines
constexpr float kLineGroupTolerancePx = 2.5f;

/// A top change beyond this marks a different visual line
constexpr float kLineChangeThresholdPx = 5.0f;

/// Maximum positions walked back when rewinding to a line start
constexpr int kLineRewindLimit = 500;

/// Break inside a block's inline content. `top`/`bottom` are surface coordinates.
struct LineBreakResult {
    int pos = 0;
    float top = 0;
    float bottom = 0;
};

/// Drop rects without finite vertical edges or without a positive size,
/// and fill in missing horizontal edges from the width
std::optional<Rect> normalizeLineRect(const Rect& rect);

/// Merge rects into visual lines: rects whose tops and bottoms are within
/// kLineGroupTolerancePx of the current line extend it. Input order does not
/// matter; lines come back sorted top to bottom.
std::vector<Rect> groupLineRects(std::vector<Rect> rects);

/// Probe points across a line: its left edge, a set of horizontal ratios
/// depending on its width, then its center. Every point stays inside the line.
std::vector<Point> resolveSamplePoints(const Rect& line);

/// Find where the block at `blockPos` must break so that no line crossing
/// `boundaryY` stays on the current page.
///
/// Picks the first visual line whose bottom passes the boundary, hit-tests
/// it, clamps the position into the block (and to at least `minPos`), then
/// rewinds to the start of that line. A probe that lands mid-word is pulled
/// back to the previous word boundary. Returns nullopt when the block does
/// not overflow or nothing can be resolved.
std::optional<LineBreakResult> findLineBreakInBlock(const MeasurementView& view,
                                                    int blockPos,
                                                    const DocNode& blockNode,
                                                    float boundaryY,
                                                    int minPos = 0);

} // namespace pageflow
