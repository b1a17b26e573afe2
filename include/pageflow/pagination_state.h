#pragma once

#include "pageflow/break_locator.h"
#include "pageflow/layout.h"
#include "pageflow/measurement_view.h"
#include "pageflow/page.h"
#include <optional>
#include <vector>

namespace pageflow {

/// Mutable accumulator of one pagination run.
/// Offsets are in the flow space of the rendered document, relative to the
/// container top.
struct PaginationState {
    std::vector<PageEntry> pages;
    int pageIndex = 0;
    float pageStart = 0;             // Where the open page's content begins
    int blockIndex = 0;              // Cursor into the top-level blocks
    PageMargins baseMarginsPx;
    float pageHeightPx = kDefaultPageHeightPx;
    float pageWidthPx = kDefaultPageWidthPx;
    float pageGapPx = kDefaultPageGapPx;
    float contentWidthPx = 0;
    float visualStackTop = 0;        // Stacking offset of the next page preview
    std::optional<float> currentFittedBottomPx;
    int lastBreakPos = 0;
    std::optional<int> docEndPos;
    NormalizedLayout pageLayout;     // Layout of the open page

    BreakSearchBounds searchBounds() const { return {pageStart, lastBreakPos}; }
};

/// Break coordinates a new page entry starts with
struct PageEntryBreak {
    float pageStartPx = 0;
    int pos = -1;
    std::optional<float> top;
    std::optional<float> bottom;
    std::optional<float> fittedTop;
};

/// Build a page entry from a normalized layout and the run's dimensions.
/// `pageBottomSpacingPx` is rounded to 2 decimals; values under 0.5 snap to 0.
PageEntry createPageEntry(const PaginationState& pagination,
                          int pageIndex,
                          const NormalizedLayout& layout,
                          const PageEntryBreak& breakInfo,
                          float visualTopPx);

/// Open page 0 and advance the visual stack
void addFirstPage(PaginationState& pagination, const NormalizedLayout& initialLayout);

/// A break the orchestrator wants to commit
struct BreakRequest {
    std::optional<float> breakTop;
    std::optional<float> breakBottom;
    std::optional<int> breakPos;     // nullopt or negative: reuse the last break position
    std::optional<float> breakY;
    std::optional<float> lastFitTop; // Top of the last content that still fits
};

/// Close the open page at the requested break and open the next one.
///
/// Break coordinates are clamped to the page's content boundary. The next
/// page starts at the clamped break top and the block cursor steps back one
/// so the breaking block is processed again on the new page.
void recordBreak(PaginationState& pagination,
                 const BreakRequest& request,
                 const LayoutResolver& resolveLayout);

/// Apply the running fitted bottom to the trailing page's break
void finalizeTrailingPage(PaginationState& pagination);

/// Rebuild the last page with its last-page layout, then compute the spacing
/// after every page and the positions where that spacing is painted.
std::vector<PageEntry> finalizePages(PaginationState& pagination,
                                     const LayoutResolver& resolveLayout,
                                     const MeasurementView& view);

/// Unused height of the page + reserved footer + next page's reserved
/// header + the gap between the pages
float calculateSpacingAfterPage(const PageEntry& currentPage,
                                const PageEntry& nextPage,
                                float pageGapPx);

} // namespace pageflow
