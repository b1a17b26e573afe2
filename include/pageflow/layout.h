#pragma once

#include "pageflow/geometry.h"
#include "pageflow/page.h"
#include <functional>
#include <optional>
#include <string>

namespace pageflow {

/// Measurement summary of a header/footer section as reported by the host
struct HeaderFooterMetrics {
    std::optional<float> offsetPx;
    std::optional<float> distancePx;
    std::optional<float> contentHeightPx;
    std::optional<float> effectiveHeightPx;
};

struct HeaderFooterSection {
    std::optional<std::string> id;
    std::optional<std::string> sectionId;
    std::optional<std::string> areaId;
    std::optional<std::string> kind;
    std::optional<HeaderFooterMetrics> metrics;
    std::optional<float> heightPx;
    std::optional<float> contentHeightPx;
    std::optional<float> reservedHeightPx;
};

/// Header and footer resolved for a single page
struct HeaderFooterSections {
    std::optional<HeaderFooterSection> header;
    std::optional<HeaderFooterSection> footer;
};

struct PageLayoutOptions {
    bool isLastPage = false;
};

/// Host callback: header/footer for a page index (nullopt = none)
using HeaderFooterResolver =
    std::function<std::optional<HeaderFooterSections>(int pageIndex, const PageLayoutOptions& options)>;

/// Top/bottom margins that may be missing or non-finite
struct RawVerticalMargins {
    std::optional<float> top;
    std::optional<float> bottom;
};

/// A raw, possibly partial layout descriptor
struct PageLayout {
    std::optional<HeaderFooterSections> sections;
    std::optional<RawVerticalMargins> margins;
    std::optional<float> usableHeightPx;
    std::optional<float> pageHeightPx;
    std::optional<float> pageGapPx;
};

struct VerticalMargins {
    float top = 0;
    float bottom = 0;
};

/// A fully populated layout descriptor for one page
struct NormalizedLayout {
    std::optional<HeaderFooterSections> sections;
    VerticalMargins margins;
    float usableHeightPx = 0;
    float pageHeightPx = kDefaultPageHeightPx;
    std::optional<float> pageGapPx;
};

/// Resolves the normalized layout of a page index
using LayoutResolver =
    std::function<NormalizedLayout(int pageIndex, const PageLayoutOptions& options)>;

/// Resolve margins and usable height of a raw layout, applying defaults and
/// the minimum vertical margin. Never fails.
NormalizedLayout normalizeLayout(const std::optional<PageLayout>& layout,
                                 const PageMargins& baseMarginsPx,
                                 float pageHeightPx);

/// Convert a section summary into a reserved-area descriptor.
/// `role` is "header" or "footer"; footers grow upward from the page bottom.
HeaderFooterArea formatHeaderFooterArea(const std::optional<HeaderFooterSection>& section,
                                        float fallbackMarginPx,
                                        const std::string& role,
                                        float marginLeftPx = 0,
                                        float marginRightPx = 0);

HeaderFooterAreas createHeaderFooterAreas(const std::optional<HeaderFooterSections>& sections,
                                          float marginTopPx,
                                          float marginBottomPx,
                                          float marginLeftPx = 0,
                                          float marginRightPx = 0);

/// Query the host for a page's header/footer and derive its margins,
/// enforcing the minimum vertical margin whether or not sections exist.
PageLayout resolvePageLayoutForIndex(int pageIndex,
                                     const PageLayoutOptions& options,
                                     const HeaderFooterResolver& resolveHeaderFooter,
                                     const PageMargins& baseMarginsPx,
                                     float pageHeightPx);

/// Compose resolvePageLayoutForIndex and normalizeLayout
LayoutResolver createLayoutResolver(HeaderFooterResolver resolveHeaderFooter,
                                    const PageMargins& baseMarginsPx,
                                    float pageHeightPx);

/// Page width from an explicit value, the container, or the default
float resolvePageWidthPx(std::optional<float> explicitWidthPx,
                         const std::optional<Rect>& containerRect,
                         const std::optional<OffsetBox>& containerOffsets);

/// Page width minus left/right margins, never negative
float resolveContentWidthPx(float pageWidthPx,
                            const PageMargins& baseMarginsPx,
                            const std::optional<Rect>& containerRect);

} // namespace pageflow
