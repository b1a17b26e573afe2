#include "pageflow/pagination_state.h"
#include "pageflow/log.h"
#include "pageflow/table_overflow.h"
#include <algorithm>
#include <cmath>

namespace pageflow {

namespace {

float roundBottomSpacing(float spacing) {
    if (spacing < 0.5f) return 0;
    return std::round(spacing * 100.0f) / 100.0f;
}

/// Open a page after `pageIndex` has been advanced and push it on the stack
void pushPage(PaginationState& pagination, const NormalizedLayout& layout, const PageEntryBreak& breakInfo) {
    PageEntry entry = createPageEntry(pagination, pagination.pageIndex, layout, breakInfo,
                                      pagination.visualStackTop);
    pagination.visualStackTop = computeNextVisualTop(entry.pageTopOffsetPx,
                                                     entry.metrics.pageHeightPx,
                                                     entry.pageGapPx);
    pagination.pages.push_back(std::move(entry));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Page entries
// ---------------------------------------------------------------------------

PageEntry createPageEntry(const PaginationState& pagination,
                          int pageIndex,
                          const NormalizedLayout& layout,
                          const PageEntryBreak& breakInfo,
                          float visualTopPx) {
    const PageMargins& base = pagination.baseMarginsPx;
    float marginTopPx = getSafeNumber({layout.margins.top, base.top});
    float marginBottomPx = getSafeNumber({layout.margins.bottom, base.bottom});
    float marginLeftPx = getSafeNumber({base.left, kDefaultMarginPx});
    float marginRightPx = getSafeNumber({base.right, kDefaultMarginPx});
    float pageGapPx = getSafeNumber({layout.pageGapPx, pagination.pageGapPx, kDefaultPageGapPx});

    PageEntry entry;
    entry.pageIndex = pageIndex;
    entry.pageTopOffsetPx = getSafeNumber({visualTopPx});
    entry.pageGapPx = pageGapPx;

    BreakInfo& info = entry.breakInfo;
    info.startOffsetPx = getSafeNumber({breakInfo.pageStartPx});
    info.pos = breakInfo.pos;
    info.top = finiteOrNull(breakInfo.top);
    if (auto bottom = finiteOrNull(breakInfo.bottom)) {
        info.bottom = bottom;
        info.fittedBottom = bottom;
    }
    info.fittedTop = finiteOrNull(breakInfo.fittedTop);

    float usableHeightPx = getSafeNumber({layout.usableHeightPx});
    float contentBottomBoundaryPx = info.startOffsetPx + usableHeightPx;

    std::optional<float> fittedBottomPx = info.fittedBottom ? info.fittedBottom : info.top;
    if (fittedBottomPx) {
        info.fittedBottom = std::min(*fittedBottomPx, contentBottomBoundaryPx);
        if (info.bottom) {
            info.bottom = std::min(*info.bottom, *info.fittedBottom);
        }
        entry.pageBottomSpacingPx = roundBottomSpacing(
            std::max(contentBottomBoundaryPx - *info.fittedBottom, 0.0f));
    }

    entry.headerFooterAreas = createHeaderFooterAreas(layout.sections, marginTopPx, marginBottomPx,
                                                      marginLeftPx, marginRightPx);
    const auto& header = entry.headerFooterAreas.header;
    const auto& footer = entry.headerFooterAreas.footer;

    entry.contentArea.startPx = info.startOffsetPx;
    entry.contentArea.endPx = contentBottomBoundaryPx;
    entry.contentArea.usableHeightPx = usableHeightPx;

    PageMetrics& metrics = entry.metrics;
    metrics.pageHeightPx = getSafeNumber({layout.pageHeightPx, pagination.pageHeightPx, kDefaultPageHeightPx});
    metrics.pageWidthPx = getSafeNumber({pagination.pageWidthPx, kDefaultPageWidthPx});
    metrics.marginTopPx = marginTopPx;
    metrics.marginBottomPx = marginBottomPx;
    metrics.marginLeftPx = marginLeftPx;
    metrics.marginRightPx = marginRightPx;
    metrics.contentHeightPx = usableHeightPx;
    metrics.contentWidthPx = getSafeNumber({pagination.contentWidthPx});
    metrics.headerHeightPx = getSafeNumber({header.heightPx, header.metrics.effectiveHeightPx, marginTopPx});
    metrics.footerHeightPx = getSafeNumber({footer.heightPx, footer.metrics.effectiveHeightPx, marginBottomPx});
    metrics.pageGapPx = pageGapPx;

    return entry;
}

void addFirstPage(PaginationState& pagination, const NormalizedLayout& initialLayout) {
    PageEntryBreak breakInfo;
    breakInfo.pageStartPx = pagination.pageStart;
    pushPage(pagination, initialLayout, breakInfo);
}

// ---------------------------------------------------------------------------
// Breaks
// ---------------------------------------------------------------------------

void recordBreak(PaginationState& pagination,
                 const BreakRequest& request,
                 const LayoutResolver& resolveLayout) {
    float pageStart = pagination.pageStart;
    float rawBottom = getSafeNumber({request.breakBottom, request.breakTop, pageStart});
    float breakBottom = std::max(rawBottom, pageStart);
    auto lastFitTop = finiteOrNull(request.lastFitTop);
    float breakTop = lastFitTop ? std::min(*lastFitTop, breakBottom) : breakBottom;

    bool hasBreakPos = request.breakPos && *request.breakPos >= 0;
    int resolvedPos = hasBreakPos ? *request.breakPos : pagination.lastBreakPos;

    float contentBottomBoundary = pageStart + pagination.pageLayout.usableHeightPx;
    breakBottom = std::min(breakBottom, contentBottomBoundary);
    breakTop = std::min(breakTop, breakBottom);

    if (pagination.pageIndex >= 0 && pagination.pageIndex < static_cast<int>(pagination.pages.size())) {
        PageEntry& current = pagination.pages[pagination.pageIndex];
        BreakInfo& info = current.breakInfo;
        info.startOffsetPx = pageStart;
        info.pos = resolvedPos;
        info.top = breakTop;
        info.bottom = breakBottom;
        info.fittedTop = breakTop;
        info.fittedBottom = breakBottom;
        if (auto breakY = finiteOrNull(request.breakY)) {
            info.breakY = breakY;
        }
        current.pageBottomSpacingPx = std::max(contentBottomBoundary - breakTop, 0.0f);
    }

    if (hasBreakPos) {
        pagination.lastBreakPos = resolvedPos;
    }

    PF_LOGD("recordBreak: page=%d pos=%d top=%.1f bottom=%.1f",
            pagination.pageIndex, resolvedPos, breakTop, breakBottom);

    int nextPageIndex = pagination.pageIndex + 1;
    NormalizedLayout nextLayout = resolveLayout
        ? resolveLayout(nextPageIndex, PageLayoutOptions{false})
        : normalizeLayout(std::nullopt, pagination.baseMarginsPx, pagination.pageHeightPx);

    // The next page starts at the break itself; inter-page spacing is
    // painted by the renderer, not added to the flow offset
    pagination.pageStart = breakTop;
    pagination.pageIndex = nextPageIndex;
    pagination.blockIndex -= 1;
    pagination.pageLayout = nextLayout;
    if (std::isfinite(nextLayout.pageHeightPx)) {
        pagination.pageHeightPx = nextLayout.pageHeightPx;
    }
    if (auto gap = finiteOrNull(nextLayout.pageGapPx)) {
        pagination.pageGapPx = *gap;
    }

    PageEntryBreak breakInfo;
    breakInfo.pageStartPx = pagination.pageStart;
    pushPage(pagination, nextLayout, breakInfo);

    pagination.currentFittedBottomPx.reset();
}

// ---------------------------------------------------------------------------
// Finalization
// ---------------------------------------------------------------------------

void finalizeTrailingPage(PaginationState& pagination) {
    if (pagination.pages.empty() || !isFiniteValue(pagination.currentFittedBottomPx)) return;

    float fittedBottom = *pagination.currentFittedBottomPx;
    BreakInfo& info = pagination.pages.back().breakInfo;
    info.fittedBottom = fittedBottom;
    if (!isFiniteValue(info.bottom)) info.bottom = fittedBottom;
    if (!isFiniteValue(info.top)) info.top = fittedBottom;
    if (!isFiniteValue(info.fittedTop)) info.fittedTop = fittedBottom;
}

float calculateSpacingAfterPage(const PageEntry& currentPage,
                                const PageEntry& nextPage,
                                float pageGapPx) {
    float pageBottomSpacing = getSafeNumber({currentPage.pageBottomSpacingPx});

    float footerHeight = getSafeNumber({currentPage.metrics.footerHeightPx});
    float footerMargin = getSafeNumber({currentPage.metrics.marginBottomPx, footerHeight});
    float footerReserved = std::max({footerHeight, footerMargin, 0.0f});

    float nextHeaderHeight = getSafeNumber({nextPage.metrics.headerHeightPx});
    float nextHeaderMargin = getSafeNumber({nextPage.metrics.marginTopPx, nextHeaderHeight});
    float nextHeaderReserved = std::max({nextHeaderHeight, nextHeaderMargin, 0.0f});

    float gap = getSafeNumber({pageGapPx});
    return pageBottomSpacing + footerReserved + nextHeaderReserved + gap;
}

std::vector<PageEntry> finalizePages(PaginationState& pagination,
                                     const LayoutResolver& resolveLayout,
                                     const MeasurementView& view) {
    auto& pages = pagination.pages;
    if (pages.empty()) return pages;

    PageEntry& lastEntry = pages.back();
    int lastPageIndex = lastEntry.pageIndex;

    NormalizedLayout lastLayout = resolveLayout
        ? resolveLayout(lastPageIndex, PageLayoutOptions{true})
        : pagination.pageLayout;

    // The rebuilt entry uses the last-page dimensions only
    float previousPageHeightPx = pagination.pageHeightPx;
    float previousPageGapPx = pagination.pageGapPx;
    if (std::isfinite(lastLayout.pageHeightPx)) {
        pagination.pageHeightPx = lastLayout.pageHeightPx;
    }
    if (auto gap = finiteOrNull(lastLayout.pageGapPx)) {
        pagination.pageGapPx = *gap;
    }

    const BreakInfo& lastBreak = lastEntry.breakInfo;
    PageEntryBreak breakInfo;
    breakInfo.pageStartPx = getSafeNumber({lastBreak.startOffsetPx,
                                           lastPageIndex == 0 ? 0.0f : pagination.pageStart});
    breakInfo.pos = lastBreak.pos >= 0 ? lastBreak.pos : pagination.docEndPos.value_or(-1);
    breakInfo.top = finiteOrNull(lastBreak.top);
    breakInfo.bottom = isFiniteValue(lastBreak.bottom) ? lastBreak.bottom : breakInfo.top;
    breakInfo.fittedTop = finiteOrNull(lastBreak.fittedTop);

    lastEntry = createPageEntry(pagination, lastPageIndex, lastLayout, breakInfo,
                                lastEntry.pageTopOffsetPx);

    pagination.pageHeightPx = previousPageHeightPx;
    pagination.pageGapPx = previousPageGapPx;

    int docSize = view.docSize();
    for (size_t i = 0; i < pages.size(); ++i) {
        PageEntry& page = pages[i];
        if (i + 1 == pages.size()) {
            page.spacingAfterPx = 0;
            page.spacingSegments.clear();
            continue;
        }

        page.spacingAfterPx = calculateSpacingAfterPage(page, pages[i + 1], page.pageGapPx);
        int basePos = clampToDoc(page.breakInfo.pos, docSize);
        if (std::isfinite(page.spacingAfterPx) && page.spacingAfterPx > 0) {
            page.spacingSegments = deriveSpacingSegments(view, basePos, page.breakInfo.breakY);
        } else {
            page.spacingSegments = {basePos};
        }
    }

    PF_LOGD("finalizePages: pages=%zu last=%d", pages.size(), lastPageIndex);
    return pages;
}

} // namespace pageflow
