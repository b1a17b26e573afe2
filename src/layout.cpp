#include "pageflow/layout.h"
#include "pageflow/log.h"
#include <algorithm>
#include <cmath>

namespace pageflow {

namespace {

std::optional<std::string> firstNonEmpty(std::initializer_list<const std::optional<std::string>*> candidates) {
    for (const auto* candidate : candidates) {
        if (candidate && *candidate && !(*candidate)->empty()) {
            return *candidate;
        }
    }
    return std::nullopt;
}

/// Reserved height reported by a section, falling back to its effective
/// height or the base margin. Zero means "not reported".
float reservedHeightOf(const std::optional<HeaderFooterSection>& section, float baseMarginPx) {
    std::optional<float> effective;
    if (section && section->metrics) {
        effective = finiteOrNull(section->metrics->effectiveHeightPx);
    }
    if (section && isFiniteValue(section->reservedHeightPx) && *section->reservedHeightPx > 0) {
        return *section->reservedHeightPx;
    }
    return std::max(effective.value_or(0.0f), baseMarginPx);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Layout normalization
// ---------------------------------------------------------------------------

NormalizedLayout normalizeLayout(const std::optional<PageLayout>& layout,
                                 const PageMargins& baseMarginsPx,
                                 float pageHeightPx) {
    std::optional<float> explicitTop;
    std::optional<float> explicitBottom;
    if (layout && layout->margins) {
        explicitTop = finiteOrNull(layout->margins->top);
        explicitBottom = finiteOrNull(layout->margins->bottom);
    }

    float rawTop = explicitTop.value_or(std::max(baseMarginsPx.top, kMinimumVerticalMarginPx));
    float rawBottom = explicitBottom.value_or(std::max(baseMarginsPx.bottom, kMinimumVerticalMarginPx));

    NormalizedLayout normalized;
    normalized.margins.top = getSafeNumber({rawTop, baseMarginsPx.top, kMinimumVerticalMarginPx});
    normalized.margins.bottom = getSafeNumber({rawBottom, baseMarginsPx.bottom, kMinimumVerticalMarginPx});
    normalized.pageHeightPx = getSafeNumber({
        layout ? layout->pageHeightPx : std::nullopt,
        pageHeightPx,
        kDefaultPageHeightPx,
    });

    auto explicitUsable = layout ? finiteOrNull(layout->usableHeightPx) : std::nullopt;
    float usable = explicitUsable.value_or(
        normalized.pageHeightPx - normalized.margins.top - normalized.margins.bottom);
    normalized.usableHeightPx = std::max(usable, 0.0f);

    if (layout) {
        normalized.sections = layout->sections;
        normalized.pageGapPx = finiteOrNull(layout->pageGapPx);
    }
    return normalized;
}

// ---------------------------------------------------------------------------
// Header/footer areas
// ---------------------------------------------------------------------------

HeaderFooterArea formatHeaderFooterArea(const std::optional<HeaderFooterSection>& section,
                                        float fallbackMarginPx,
                                        const std::string& role,
                                        float marginLeftPx,
                                        float marginRightPx) {
    HeaderFooterMetrics metrics;
    if (section && section->metrics) {
        metrics = *section->metrics;
    }
    std::optional<float> sectionHeight = section ? section->heightPx : std::nullopt;
    std::optional<float> sectionContentHeight = section ? section->contentHeightPx : std::nullopt;

    float offsetPx = std::max(getSafeNumber({metrics.offsetPx, metrics.distancePx, fallbackMarginPx}), 0.0f);
    float contentHeightPx = std::max(getSafeNumber({metrics.contentHeightPx, sectionContentHeight, 0.0f}), 0.0f);
    float effectiveHeightPx = getSafeNumber({
        metrics.effectiveHeightPx,
        sectionHeight,
        contentHeightPx + offsetPx,
        fallbackMarginPx,
    });
    float heightPx = getSafeNumber({sectionHeight, effectiveHeightPx, fallbackMarginPx});
    float reservedHeightPx = std::max({heightPx, effectiveHeightPx, fallbackMarginPx, 0.0f});

    HeaderFooterArea area;
    area.heightPx = heightPx;
    area.reservedHeightPx = reservedHeightPx;
    area.metrics.offsetPx = offsetPx;
    area.metrics.contentHeightPx = contentHeightPx;
    area.metrics.effectiveHeightPx = effectiveHeightPx;

    area.slotLeftPx = std::max(getSafeNumber({marginLeftPx}), 0.0f);
    area.slotRightPx = std::max(getSafeNumber({marginRightPx}), 0.0f);
    area.slotMaxHeightPx = std::max(reservedHeightPx - offsetPx, 0.0f);
    float slotHeightCandidate = contentHeightPx > 0 ? contentHeightPx : area.slotMaxHeightPx;
    area.slotHeightPx = std::max(std::min(slotHeightCandidate, reservedHeightPx), 0.0f);

    if (role == "footer") {
        // Footer content grows upward from the page bottom
        area.slotTopPx = std::max(reservedHeightPx - offsetPx - area.slotHeightPx, 0.0f);
    } else {
        area.slotTopPx = std::min(offsetPx, reservedHeightPx);
    }

    if (section) {
        if (section->id && !section->id->empty()) area.id = section->id;
        if (section->kind && !section->kind->empty()) area.kind = section->kind;
        area.sectionId = firstNonEmpty({&section->id, &section->sectionId, &section->areaId});
    }
    if (!role.empty()) area.role = role;

    return area;
}

HeaderFooterAreas createHeaderFooterAreas(const std::optional<HeaderFooterSections>& sections,
                                          float marginTopPx,
                                          float marginBottomPx,
                                          float marginLeftPx,
                                          float marginRightPx) {
    std::optional<HeaderFooterSection> header;
    std::optional<HeaderFooterSection> footer;
    if (sections) {
        header = sections->header;
        footer = sections->footer;
    }
    return {
        formatHeaderFooterArea(header, marginTopPx, "header", marginLeftPx, marginRightPx),
        formatHeaderFooterArea(footer, marginBottomPx, "footer", marginLeftPx, marginRightPx),
    };
}

// ---------------------------------------------------------------------------
// Per-page resolution
// ---------------------------------------------------------------------------

PageLayout resolvePageLayoutForIndex(int pageIndex,
                                     const PageLayoutOptions& options,
                                     const HeaderFooterResolver& resolveHeaderFooter,
                                     const PageMargins& baseMarginsPx,
                                     float pageHeightPx) {
    std::optional<HeaderFooterSections> sections;
    if (resolveHeaderFooter) {
        sections = resolveHeaderFooter(pageIndex, options);
    }

    std::optional<HeaderFooterSection> header;
    std::optional<HeaderFooterSection> footer;
    if (sections) {
        header = sections->header;
        footer = sections->footer;
    }

    float headerReserved = reservedHeightOf(header, baseMarginsPx.top);
    float footerReserved = reservedHeightOf(footer, baseMarginsPx.bottom);

    float top = std::max({baseMarginsPx.top, headerReserved, kMinimumVerticalMarginPx});
    float bottom = std::max({baseMarginsPx.bottom, footerReserved, kMinimumVerticalMarginPx});

    PageLayout layout;
    layout.sections = sections;
    layout.margins = RawVerticalMargins{top, bottom};
    layout.usableHeightPx = std::max(pageHeightPx - top - bottom, 0.0f);
    return layout;
}

LayoutResolver createLayoutResolver(HeaderFooterResolver resolveHeaderFooter,
                                    const PageMargins& baseMarginsPx,
                                    float pageHeightPx) {
    return [resolveHeaderFooter = std::move(resolveHeaderFooter), baseMarginsPx, pageHeightPx](
               int pageIndex, const PageLayoutOptions& options) {
        auto layout = resolvePageLayoutForIndex(pageIndex, options, resolveHeaderFooter,
                                                baseMarginsPx, pageHeightPx);
        PF_LOGD("layout: page=%d last=%d margins=%.1f/%.1f usable=%.1f",
                pageIndex, options.isLastPage ? 1 : 0,
                layout.margins->top.value_or(0), layout.margins->bottom.value_or(0),
                layout.usableHeightPx.value_or(0));
        return normalizeLayout(layout, baseMarginsPx, pageHeightPx);
    };
}

// ---------------------------------------------------------------------------
// Page width
// ---------------------------------------------------------------------------

float resolvePageWidthPx(std::optional<float> explicitWidthPx,
                         const std::optional<Rect>& containerRect,
                         const std::optional<OffsetBox>& containerOffsets) {
    if (isFiniteValue(explicitWidthPx) && *explicitWidthPx > 0) {
        return *explicitWidthPx;
    }

    std::optional<float> candidates[] = {
        containerRect ? std::optional<float>(containerRect->width) : std::nullopt,
        containerOffsets ? containerOffsets->offsetWidth : std::nullopt,
    };
    for (const auto& candidate : candidates) {
        if (isFiniteValue(candidate) && *candidate > 0) {
            return *candidate;
        }
    }
    return kDefaultPageWidthPx;
}

float resolveContentWidthPx(float pageWidthPx,
                            const PageMargins& baseMarginsPx,
                            const std::optional<Rect>& containerRect) {
    float widthSource = kDefaultPageWidthPx;
    if (std::isfinite(pageWidthPx) && pageWidthPx > 0) {
        widthSource = pageWidthPx;
    } else if (containerRect && std::isfinite(containerRect->width) && containerRect->width > 0) {
        widthSource = containerRect->width;
    }

    float marginLeft = getSafeNumber({baseMarginsPx.left, kDefaultMarginPx});
    float marginRight = getSafeNumber({baseMarginsPx.right, kDefaultMarginPx});
    float contentWidth = widthSource - marginLeft - marginRight;
    return contentWidth > 0 ? contentWidth : 0;
}

} // namespace pageflow
