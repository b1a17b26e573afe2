#include "pageflow/table_overflow.h"
#include "pageflow/break_locator.h"
#include "pageflow/line_break.h"
#include "pageflow/log.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace pageflow {

namespace {

std::optional<float> topOf(const std::optional<Rect>& rect) {
    return rect ? finiteOrNull(rect->top) : std::nullopt;
}

std::optional<float> bottomOf(const std::optional<Rect>& rect) {
    return rect ? finiteOrNull(rect->bottom) : std::nullopt;
}

/// Clamp a refined line break under the boundary
RowBreak constrainRefinement(const LineBreakResult& refined, int minPos, int maxPos, float boundary) {
    RowBreak entry;
    entry.pos = std::max(minPos, std::min(refined.pos, maxPos));
    entry.bottom = std::isfinite(refined.bottom) ? std::min(refined.bottom, boundary) : boundary;
    entry.top = std::isfinite(refined.top) ? std::min(refined.top, entry.bottom) : entry.bottom;
    return entry;
}

struct RowContext {
    const DocNode* rowNode = nullptr;
    int rowPos = 0;
};

/// Enclosing row of a position that sits inside one of its cells
std::optional<RowContext> resolveTableRowContext(const ResolvedPos& resolved) {
    int rowDepth = -1;
    int cellDepth = -1;
    for (int depth = resolved.depth(); depth >= 0; --depth) {
        const auto& type = resolved.node(depth).type;
        if (cellDepth == -1 && isTableCellType(type)) {
            cellDepth = depth;
        }
        if (isTableRowType(type)) {
            rowDepth = depth;
            if (cellDepth != -1) break;
        }
    }
    if (rowDepth == -1 || cellDepth == -1 || cellDepth <= rowDepth) {
        return std::nullopt;
    }
    return RowContext{&resolved.node(rowDepth), rowDepth > 0 ? resolved.before(rowDepth) : 0};
}

int findCellSpacingPosition(const MeasurementView& view,
                            int cellPos,
                            const DocNode& cellNode,
                            float targetY,
                            int docSize) {
    int cellStart = cellPos + 1;
    int cellEnd = std::min(cellPos + cellNode.nodeSize() - 1, docSize);

    auto cellTop = topOf(view.rectAtPos(cellStart));
    auto cellBottom = bottomOf(view.rectAtPos(cellEnd));
    if (!cellTop || !cellBottom) {
        return cellEnd;
    }

    // Shorter cells keep their end; the gap pushes nothing in them
    if (*cellBottom < targetY) {
        return cellEnd;
    }

    auto found = binarySearchForYPosition(view, cellStart, cellEnd, targetY);
    return found ? found->pos : cellEnd;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Row overflow
// ---------------------------------------------------------------------------

std::optional<TableRowOverflow> findTableRowOverflow(const MeasurementView& view,
                                                     int startPos,
                                                     float boundary) {
    if (!std::isfinite(boundary)) return std::nullopt;

    int maxDocPos = std::max(0, view.docSize() - 1);
    std::optional<TableRowOverflow> detected;

    view.doc().descendants([&](const DocNode& node, int pos) {
        if (detected) return false;

        int nodeEnd = pos + node.nodeSize();
        if (nodeEnd <= startPos) return true;
        if (!isTableRowType(node.type)) return true;

        int rowStart = std::max(pos, startPos);
        int rowEnd = std::max(rowStart, nodeEnd - 1);

        auto rowRect = view.nodeRect(rowStart);
        auto rowBottom = firstFinite({
            [&] { return bottomOf(rowRect); },
            [&] { return bottomOf(view.rectAtPos(std::min(rowEnd, maxDocPos))); },
        });
        auto rowTop = firstFinite({
            [&] { return topOf(rowRect); },
            [&] { return topOf(view.rectAtPos(std::min(rowStart, maxDocPos))); },
        });
        if (!rowBottom || *rowBottom <= boundary) return true;

        int rowMinSearchPos = std::max({startPos, pos + 1, rowStart});
        int rowMaxSearchPos = std::max({rowStart, nodeEnd - 1, rowMinSearchPos});
        std::optional<RowBreak> refined;

        // Cells: the first one crossing the boundary decides
        int offset = 0;
        for (const DocNode& cellNode : node.children()) {
            int rawCellPos = pos + 1 + offset;
            int rawCellEnd = rawCellPos + std::max(0, cellNode.nodeSize() - 1);
            offset += cellNode.nodeSize();

            int cellClampedStart = std::max({rawCellPos, rowMinSearchPos, 0});
            int cellClampedEnd = std::max(cellClampedStart, std::min(rawCellEnd, maxDocPos));
            if (cellClampedEnd <= rowMinSearchPos) continue;

            auto cellRect = view.nodeRect(rawCellPos);
            auto cellBottom = firstFinite({
                [&] { return bottomOf(cellRect); },
                [&] { return bottomOf(view.rectAtPos(cellClampedEnd)); },
            });
            if (!cellBottom || *cellBottom <= boundary) continue;

            auto lineBreak = findLineBreakInBlock(view, rawCellPos, cellNode, boundary, cellClampedStart);
            if (lineBreak) {
                refined = constrainRefinement(*lineBreak, cellClampedStart, cellClampedEnd, boundary);
            } else {
                int fallbackPos = std::max(cellClampedStart, std::min(cellClampedEnd, rowMaxSearchPos));
                refined = RowBreak{fallbackPos, boundary, boundary};
            }
            break;
        }

        // The row as a whole, when it breaks earlier than the cell
        if (rowMinSearchPos <= rowMaxSearchPos) {
            if (auto lineBreak = findLineBreakInBlock(view, pos, node, boundary, rowMinSearchPos)) {
                auto rowRefinement = constrainRefinement(*lineBreak, rowMinSearchPos, rowMaxSearchPos, boundary);
                if (!refined || rowRefinement.pos < refined->pos) {
                    refined = rowRefinement;
                }
            }
        }

        if ((!refined || refined->pos <= rowStart) && rowMinSearchPos < rowMaxSearchPos) {
            auto fallback = binarySearchForYPosition(view, rowMinSearchPos, rowMaxSearchPos, boundary);
            if (fallback) {
                int clamped = clampToDoc(std::max(rowMinSearchPos, std::min(fallback->pos, rowMaxSearchPos)),
                                         maxDocPos);
                if (clamped > rowStart) {
                    // Keep the coords found at the boundary, not those of the rewound position
                    auto coords = fallback->coords ? fallback->coords : view.rectAtPos(clamped);
                    float bottom = std::min(bottomOf(coords).value_or(boundary), boundary);
                    float top = std::min(topOf(coords).value_or(bottom), bottom);
                    refined = RowBreak{clamped, top, bottom};
                }
            }
        }

        RowBreak finalBreak = refined.value_or(RowBreak{rowStart, boundary, boundary});
        PF_LOGD("findTableRowOverflow: row=%d bottom=%.1f boundary=%.1f break=%d%s",
                pos, *rowBottom, boundary, finalBreak.pos, refined ? "" : " (row start)");

        TableRowOverflow overflow;
        overflow.breakInfo = finalBreak;
        overflow.rowBreaks.push_back(finalBreak);
        overflow.rowPos = pos;
        overflow.rowRect = view.nodeRect(pos);
        overflow.rowTop = rowTop;
        overflow.rowBottom = rowBottom;
        overflow.boundary = boundary;
        detected = overflow;
        return false;
    });

    return detected;
}

// ---------------------------------------------------------------------------
// Position search
// ---------------------------------------------------------------------------

std::optional<YSearchResult> binarySearchForYPosition(const MeasurementView& view,
                                                      int startPos,
                                                      int endPos,
                                                      float targetY,
                                                      int maxIterations) {
    if (!std::isfinite(targetY) || startPos > endPos) return std::nullopt;

    int left = std::max(0, startPos);
    int right = std::max(left, endPos);
    std::optional<int> bestPos;
    std::optional<Rect> bestCoords;
    float bestDistance = std::numeric_limits<float>::infinity();

    for (int i = 0; i < maxIterations && left <= right; ++i) {
        int mid = left + (right - left) / 2;
        auto coords = view.rectAtPos(mid);
        if (!coords) {
            if (mid <= left) {
                ++left;
            } else {
                --right;
            }
            continue;
        }

        float distance = std::fabs(coords->top - targetY);
        if (distance < bestDistance) {
            bestDistance = distance;
            bestPos = mid;
            bestCoords = coords;
        }

        if (coords->top < targetY) {
            left = mid + 1;
        } else {
            right = mid - 1;
        }
    }

    if (!bestPos) return std::nullopt;

    float sampledTop = bestCoords->top;
    int lineStartPos = *bestPos;
    for (int checkPos = *bestPos - 1; checkPos >= startPos && *bestPos - checkPos < kLineRewindLimit; --checkPos) {
        auto checkCoords = view.rectAtPos(checkPos);
        if (checkCoords && std::fabs(checkCoords->top - sampledTop) > kLineChangeThresholdPx) {
            lineStartPos = checkPos + 1;
            break;
        }
        if (checkPos == startPos) {
            lineStartPos = startPos;
            break;
        }
    }

    return YSearchResult{lineStartPos, bestCoords};
}

// ---------------------------------------------------------------------------
// Spacing segments
// ---------------------------------------------------------------------------

std::vector<int> deriveSpacingSegments(const MeasurementView& view,
                                       int basePos,
                                       std::optional<float> breakY) {
    if (basePos < 0) return {};

    int docSize = view.docSize();
    int clampedBase = clampToDoc(basePos, docSize);

    auto resolved = view.doc().resolve(clampedBase);
    if (!resolved) return {clampedBase};

    auto rowContext = resolveTableRowContext(*resolved);
    if (!rowContext) return {clampedBase};

    auto targetY = finiteOrNull(breakY);
    if (!targetY) {
        auto coords = view.rectAtPos(resolved->pos());
        targetY = firstFinite({
            [&] { return bottomOf(coords); },
            [&] { return topOf(coords); },
        });
    }
    if (!targetY) return {clampedBase};

    std::vector<int> segments;
    int offset = rowContext->rowPos + 1;
    for (const DocNode& cellNode : rowContext->rowNode->children()) {
        int cellPos = offset;
        offset += cellNode.nodeSize();
        segments.push_back(clampToDoc(findCellSpacingPosition(view, cellPos, cellNode, *targetY, docSize),
                                      docSize));
    }

    if (segments.empty()) return {clampedBase};
    std::sort(segments.begin(), segments.end());
    return segments;
}

} // namespace pageflow
