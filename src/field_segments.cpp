#include "pageflow/field_segments.h"
#include "pageflow/log.h"
#include <algorithm>
#include <cmath>

namespace pageflow {

bool isHtmlFieldNode(const DocNode& node) {
    return node.type == "fieldAnnotation" && node.attr("type") == "html";
}

std::optional<FieldPageSegment> computePageSegment(const PageEntry& page,
                                                   float fieldTopPx,
                                                   float fieldBottomPx) {
    float pageStart = getSafeNumber({page.breakInfo.startOffsetPx});
    float contentBoundary = pageStart + getSafeNumber({page.metrics.contentHeightPx});
    float constrainedEnd = isFiniteValue(page.breakInfo.fittedBottom)
        ? std::min(*page.breakInfo.fittedBottom, contentBoundary)
        : contentBoundary;
    float pageEnd = std::max(constrainedEnd, pageStart);
    if (!std::isfinite(pageEnd) || pageEnd <= pageStart) return std::nullopt;

    float pageContentStart = pageStart + getSafeNumber({page.metrics.marginTopPx});
    float displayTop = std::max(fieldTopPx, pageContentStart);
    float displayBottom = std::min(fieldBottomPx, pageEnd);
    if (displayBottom <= displayTop) return std::nullopt;

    float topWithinPage = std::max(displayTop - pageContentStart, 0.0f);
    float bottomWithinPage = std::max(displayBottom - pageContentStart, topWithinPage);
    float heightWithinPage = bottomWithinPage - topWithinPage;
    if (heightWithinPage <= 0) return std::nullopt;

    FieldPageSegment segment;
    segment.pageIndex = page.pageIndex;
    segment.absoluteTopPx = displayTop;
    segment.absoluteBottomPx = displayBottom;
    segment.topPx = topWithinPage;
    segment.heightPx = heightWithinPage;
    segment.offsetWithinFieldPx = displayTop - fieldTopPx;
    return segment;
}

std::vector<FieldSegment> computeHtmlFieldSegments(const MeasurementView& view,
                                                   const Rect& containerRect,
                                                   const std::vector<PageEntry>& pages) {
    std::vector<FieldSegment> fields;
    if (pages.empty()) return fields;

    view.doc().descendants([&](const DocNode& node, int pos) {
        if (!isHtmlFieldNode(node)) return true;

        auto rect = view.nodeRect(pos);
        if (!rect) return true;

        float fieldTop = rect->top - containerRect.top;
        float fieldBottom = rect->bottom - containerRect.top;
        if (!std::isfinite(fieldTop) || !std::isfinite(fieldBottom)) return true;

        FieldSegment field;
        for (const auto& page : pages) {
            if (auto segment = computePageSegment(page, fieldTop, fieldBottom)) {
                field.segments.push_back(*segment);
            }
        }
        if (field.segments.empty()) return true;

        field.pos = pos;
        field.nodeSize = node.nodeSize();
        field.attrs = node.attrs;
        field.leftPx = rect->left - containerRect.left;
        field.widthPx = rect->width;
        field.topPx = fieldTop;
        field.heightPx = rect->height;
        fields.push_back(std::move(field));
        return true;
    });

    if (!fields.empty()) {
        PF_LOGD("computeHtmlFieldSegments: fields=%zu", fields.size());
    }
    return fields;
}

} // namespace pageflow
