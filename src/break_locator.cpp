#include "pageflow/break_locator.h"
#include "pageflow/line_break.h"
#include "pageflow/log.h"
#include <algorithm>
#include <cmath>

namespace pageflow {

namespace {

float containerTopOf(const Rect& containerRect) {
    return getSafeNumber({containerRect.top});
}

/// Node at `pos`, retrying one position earlier
std::pair<const DocNode*, int> resolveBlockNode(const MeasurementView& view, int pos) {
    if (const DocNode* node = view.nodeAt(pos)) return {node, pos};
    if (pos > 0) {
        if (const DocNode* node = view.nodeAt(pos - 1)) return {node, pos - 1};
    }
    return {nullptr, pos};
}

struct AbsoluteBreak {
    int pos = 0;
    float top = 0;
    float bottom = 0;
};

/// Fill in whatever the inline search could not measure
AbsoluteBreak ensureValidBreakResult(const MeasurementView& view,
                                     const std::optional<LineBreakResult>& result,
                                     int blockPos,
                                     const std::optional<Rect>& blockRect,
                                     float containerTop) {
    AbsoluteBreak resolved;
    resolved.pos = result ? result->pos : blockPos;
    if (result) {
        resolved.top = result->top;
        resolved.bottom = result->bottom;
        return resolved;
    }

    auto coords = view.rectAtPos(resolved.pos);
    auto top = firstFinite({
        [&] { return coords ? std::optional<float>(coords->top) : std::nullopt; },
        [&] { return blockRect ? std::optional<float>(blockRect->top) : std::nullopt; },
    });
    resolved.top = top.value_or(containerTop);

    auto bottom = firstFinite({
        [&] { return coords ? std::optional<float>(coords->bottom) : std::nullopt; },
        [&] { return blockRect ? std::optional<float>(blockRect->bottom) : std::nullopt; },
    });
    resolved.bottom = bottom.value_or(resolved.top);
    return resolved;
}

} // anonymous namespace

bool isTableRowType(const std::string& type) {
    return type == "tableRow" || type == "row";
}

bool isTableCellType(const std::string& type) {
    return type == "tableCell" || type == "tableHeader";
}

// ---------------------------------------------------------------------------
// Leaf blocks
// ---------------------------------------------------------------------------

BreakResult findAndNormalizeBreakResult(const MeasurementView& view,
                                        int pos,
                                        const DocNode* node,
                                        float absoluteBoundary,
                                        int lastBreakBase,
                                        const Rect& containerRect,
                                        const BreakSearchBounds& bounds,
                                        const std::optional<Rect>& blockRect) {
    float containerTop = containerTopOf(containerRect);
    float pageLimit = absoluteBoundary - containerTop;

    std::optional<LineBreakResult> lineBreak;
    if (node) {
        lineBreak = findLineBreakInBlock(view, pos, *node, absoluteBoundary, lastBreakBase);
    }
    auto normalized = ensureValidBreakResult(view, lineBreak, pos, blockRect, containerTop);

    float relativeTop = std::isfinite(normalized.top) ? normalized.top - containerTop : bounds.pageStartPx;
    float relativeBottom = std::isfinite(normalized.bottom) ? normalized.bottom - containerTop : relativeTop;

    BreakResult result;
    result.fittedBottom = std::min(std::max(relativeBottom, bounds.pageStartPx), pageLimit);
    result.fittedTop = std::min(std::max(relativeTop, bounds.pageStartPx), result.fittedBottom);
    result.pos = normalized.pos;
    result.breakY = normalized.top;
    return result;
}

// ---------------------------------------------------------------------------
// Containers
// ---------------------------------------------------------------------------

std::optional<BreakResult> findBreakInBlockContainer(const MeasurementView& view,
                                                     int containerPos,
                                                     const DocNode& containerNode,
                                                     float absoluteBoundary,
                                                     const Rect& containerRect,
                                                     const BreakSearchBounds& bounds) {
    if (containerNode.childCount() == 0) return std::nullopt;

    int docSize = view.docSize();
    int offset = containerPos + 1;

    for (const DocNode& childNode : containerNode.children()) {
        int childPos = offset;
        offset += childNode.nodeSize();
        int childEnd = std::min(childPos + childNode.nodeSize() - 1, docSize);

        // Rendered rects include padding and borders that caret rects miss
        auto childRect = view.nodeRect(childPos);
        auto childTop = firstFinite({
            [&] { return childRect ? std::optional<float>(childRect->top) : std::nullopt; },
            [&] {
                auto coords = view.rectAtPos(childPos);
                return coords ? std::optional<float>(coords->top) : std::nullopt;
            },
        });
        auto childBottom = firstFinite({
            [&] { return childRect ? std::optional<float>(childRect->bottom) : std::nullopt; },
            [&] {
                auto coords = view.rectAtPos(childEnd);
                return coords ? std::optional<float>(coords->bottom) : std::nullopt;
            },
        });
        if (!childTop || !childBottom) continue;

        bool crosses = *childTop <= absoluteBoundary && *childBottom > absoluteBoundary;
        if (!crosses) continue;

        if (childNode.kind() == NodeKind::Leaf) {
            return findAndNormalizeBreakResult(view, childPos, &childNode, absoluteBoundary,
                                               bounds.lastBreakPos + 1, containerRect, bounds,
                                               childRect);
        }

        if (auto nested = findBreakInBlockContainer(view, childPos, childNode, absoluteBoundary,
                                                    containerRect, bounds)) {
            return nested;
        }

        // The container straddles the boundary but its content does not:
        // break right before it so it moves to the next page whole.
        int firstLeafPos = childPos;
        const DocNode* current = &childNode;
        int currentPos = childPos;
        while (current->kind() == NodeKind::Container && current->childCount() > 0) {
            firstLeafPos = currentPos + 1;
            current = &current->child(0);
            currentPos = firstLeafPos;
        }

        auto leafCoords = view.rectAtPos(firstLeafPos);
        float firstLeafTop = leafCoords ? leafCoords->top : *childTop;
        if (firstLeafTop <= absoluteBoundary) {
            float containerTop = containerTopOf(containerRect);
            float relativeTop = std::max(firstLeafTop - containerTop, bounds.pageStartPx);
            float pageLimit = absoluteBoundary - containerTop;

            BreakResult result;
            result.fittedBottom = std::min(relativeTop, pageLimit);
            result.fittedTop = std::min(std::max(relativeTop, bounds.pageStartPx), result.fittedBottom);
            result.pos = std::max(childPos - 1, bounds.lastBreakPos);
            result.breakY = firstLeafTop;
            PF_LOGD("findBreakInBlockContainer: pushing padded '%s' at %d to next page",
                    childNode.type.c_str(), childPos);
            return result;
        }
    }

    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Entry point
// ---------------------------------------------------------------------------

std::optional<BreakResult> getExactBreakPosition(const MeasurementView& view,
                                                 ElementHandle block,
                                                 const Rect& containerRect,
                                                 float pageLimit,
                                                 const BreakSearchBounds& bounds) {
    auto blockRect = view.elementRect(block);
    float containerTop = containerTopOf(containerRect);
    float containerLeft = getSafeNumber({containerRect.left});
    float absoluteBoundary = containerTop + pageLimit;

    auto blockPos = view.posFromElement(block, 0);
    if (!blockPos) {
        float probeLeft = blockRect ? getSafeNumber({blockRect->left, containerLeft}) : containerLeft;
        float probeTop = blockRect ? getSafeNumber({blockRect->bottom, absoluteBoundary}) : absoluteBoundary;
        blockPos = view.posFromPoint({probeLeft, std::min(probeTop, absoluteBoundary)});
    }
    if (!blockPos) {
        PF_LOGD("getExactBreakPosition: block=%d has no document position", block);
        return std::nullopt;
    }

    auto [blockNode, searchPos] = resolveBlockNode(view, *blockPos);

    // A table block resolving to one of its rows is searched from the table
    if (blockNode && isTableRowType(blockNode->type)) {
        if (auto resolved = view.doc().resolve(searchPos)) {
            for (int depth = resolved->depth(); depth > 0; --depth) {
                if (resolved->node(depth).type == "table") {
                    blockNode = &resolved->node(depth);
                    searchPos = resolved->before(depth);
                    break;
                }
            }
        }
    }

    if (blockNode && blockNode->kind() == NodeKind::Container) {
        return findBreakInBlockContainer(view, searchPos, *blockNode, absoluteBoundary,
                                         containerRect, bounds);
    }

    return findAndNormalizeBreakResult(view, searchPos, blockNode, absoluteBoundary,
                                       bounds.lastBreakPos + 1, containerRect, bounds, blockRect);
}

} // namespace pageflow
