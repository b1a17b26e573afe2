#pragma once

#include "pageflow/constants.h"
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

namespace pageflow {

/// Page margins in px
struct PageMargins {
    float top = kDefaultMarginPx;
    float bottom = kDefaultMarginPx;
    float left = kDefaultMarginPx;
    float right = kDefaultMarginPx;
};

/// Measured geometry of a header or footer area
struct HeaderFooterAreaMetrics {
    float offsetPx = 0;          // Distance from the page edge to the slot
    float contentHeightPx = 0;   // Height of the measured content
    float effectiveHeightPx = 0; // Content + offset, or what the section reported
};

/// Space reserved for a header or footer on a page
struct HeaderFooterArea {
    float heightPx = 0;
    float reservedHeightPx = 0;  // Always >= max(content + offset, fallback margin)
    HeaderFooterAreaMetrics metrics;

    // Slot where the content is painted, relative to the reserved area
    float slotTopPx = 0;
    float slotHeightPx = 0;
    float slotMaxHeightPx = 0;
    float slotLeftPx = 0;
    float slotRightPx = 0;

    std::optional<std::string> id;
    std::optional<std::string> kind;
    std::optional<std::string> role;       // "header" or "footer"
    std::optional<std::string> sectionId;
};

struct HeaderFooterAreas {
    HeaderFooterArea header;
    HeaderFooterArea footer;
};

/// Where a page ends.
/// Coordinates live in the single unbounded flow space of the rendered document.
struct BreakInfo {
    float startOffsetPx = 0;            // Flow offset where this page's content begins
    int pos = -1;                       // Document position of the break (-1 = open page)
    std::optional<float> top;
    std::optional<float> bottom;
    std::optional<float> fittedTop;     // Clamped to the page content boundary
    std::optional<float> fittedBottom;
    std::optional<float> breakY;        // Absolute, unclamped surface Y of the break
};

struct PageMetrics {
    float pageHeightPx = 0;
    float pageWidthPx = 0;
    float marginTopPx = 0;
    float marginBottomPx = 0;
    float marginLeftPx = 0;
    float marginRightPx = 0;
    float contentHeightPx = 0;
    float contentWidthPx = 0;
    float headerHeightPx = 0;
    float footerHeightPx = 0;
    float pageGapPx = 0;
};

/// Flow range holding this page's content
struct ContentArea {
    std::optional<float> startPx;
    std::optional<float> endPx;
    std::optional<float> usableHeightPx;
};

/// A single paginated page
struct PageEntry {
    int pageIndex = 0;
    BreakInfo breakInfo;
    PageMetrics metrics;
    float pageTopOffsetPx = 0;      // Visual stacking offset of the page preview
    float pageGapPx = 0;
    /// Unused height inside this page's content area. Never added to the
    /// next page's start offset.
    std::optional<float> pageBottomSpacingPx;
    HeaderFooterAreas headerFooterAreas;
    ContentArea contentArea;
    float spacingAfterPx = 0;
    std::vector<int> spacingSegments;  // Document positions where the gap is painted
};

/// Visible slice of an html field on one page
struct FieldPageSegment {
    int pageIndex = 0;
    float absoluteTopPx = 0;
    float absoluteBottomPx = 0;
    float topPx = 0;
    float heightPx = 0;
    float offsetWithinFieldPx = 0;
};

/// An html field node and the pages it spans
struct FieldSegment {
    int pos = 0;
    int nodeSize = 0;
    Json::Value attrs{Json::objectValue};   // Copied from the field node
    float leftPx = 0;
    float widthPx = 0;
    float topPx = 0;
    float heightPx = 0;
    std::vector<FieldPageSegment> segments;
};

/// Warning types that may occur during pagination
enum class PaginationWarning {
    None,
    NoRenderSurface,
    NoUsableHeight,
    UnresolvedBreak,
    PageOverflow,
    ParseError,
};

struct Units {
    std::string unit = "px";
    float dpi = kPixelsPerInch;
};

/// Result of paginating a document
struct PaginationResult {
    Json::Value document;                  // Serialized snapshot, unchanged
    Units units;
    std::vector<PageEntry> pages;
    std::vector<FieldSegment> fieldSegments;
    std::vector<PaginationWarning> warnings;
};

const char* toString(PaginationWarning warning);

} // namespace pageflow
