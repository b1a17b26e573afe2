#include "pageflow/serialize.h"

namespace pageflow {

namespace {

/// Absent optionals are left out of the object
void setIfPresent(Json::Value& object, const char* key, const std::optional<float>& value) {
    if (value) object[key] = *value;
}

/// Absent optionals are written as null
Json::Value orNull(const std::optional<float>& value) {
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

Json::Value toJson(const Units& units) {
    Json::Value value(Json::objectValue);
    value["unit"] = units.unit;
    value["dpi"] = units.dpi;
    return value;
}

Json::Value toJson(const ContentArea& area) {
    Json::Value value(Json::objectValue);
    value["startPx"] = orNull(area.startPx);
    value["endPx"] = orNull(area.endPx);
    value["usableHeightPx"] = orNull(area.usableHeightPx);
    return value;
}

Json::Value toJson(const FieldPageSegment& segment) {
    Json::Value value(Json::objectValue);
    value["pageIndex"] = segment.pageIndex;
    value["absoluteTopPx"] = segment.absoluteTopPx;
    value["absoluteBottomPx"] = segment.absoluteBottomPx;
    value["topPx"] = segment.topPx;
    value["heightPx"] = segment.heightPx;
    value["offsetWithinFieldPx"] = segment.offsetWithinFieldPx;
    return value;
}

} // anonymous namespace

const char* toString(PaginationWarning warning) {
    switch (warning) {
        case PaginationWarning::None:            return "none";
        case PaginationWarning::NoRenderSurface: return "noRenderSurface";
        case PaginationWarning::NoUsableHeight:  return "noUsableHeight";
        case PaginationWarning::UnresolvedBreak: return "unresolvedBreak";
        case PaginationWarning::PageOverflow:    return "pageOverflow";
        case PaginationWarning::ParseError:      return "parseError";
    }
    return "unknown";
}

Json::Value toJson(const BreakInfo& info) {
    Json::Value value(Json::objectValue);
    value["startOffsetPx"] = info.startOffsetPx;
    value["pos"] = info.pos;
    setIfPresent(value, "top", info.top);
    setIfPresent(value, "bottom", info.bottom);
    setIfPresent(value, "fittedTop", info.fittedTop);
    setIfPresent(value, "fittedBottom", info.fittedBottom);
    setIfPresent(value, "breakY", info.breakY);
    return value;
}

Json::Value toJson(const PageMetrics& metrics) {
    Json::Value value(Json::objectValue);
    value["pageHeightPx"] = metrics.pageHeightPx;
    value["pageWidthPx"] = metrics.pageWidthPx;
    value["marginTopPx"] = metrics.marginTopPx;
    value["marginBottomPx"] = metrics.marginBottomPx;
    value["marginLeftPx"] = metrics.marginLeftPx;
    value["marginRightPx"] = metrics.marginRightPx;
    value["contentHeightPx"] = metrics.contentHeightPx;
    value["contentWidthPx"] = metrics.contentWidthPx;
    value["headerHeightPx"] = metrics.headerHeightPx;
    value["footerHeightPx"] = metrics.footerHeightPx;
    value["pageGapPx"] = metrics.pageGapPx;
    return value;
}

Json::Value toJson(const HeaderFooterArea& area) {
    Json::Value value(Json::objectValue);
    value["heightPx"] = area.heightPx;
    value["reservedHeightPx"] = area.reservedHeightPx;

    Json::Value metrics(Json::objectValue);
    metrics["offsetPx"] = area.metrics.offsetPx;
    metrics["contentHeightPx"] = area.metrics.contentHeightPx;
    metrics["effectiveHeightPx"] = area.metrics.effectiveHeightPx;
    value["metrics"] = metrics;

    value["slotTopPx"] = area.slotTopPx;
    value["slotHeightPx"] = area.slotHeightPx;
    value["slotMaxHeightPx"] = area.slotMaxHeightPx;
    value["slotLeftPx"] = area.slotLeftPx;
    value["slotRightPx"] = area.slotRightPx;

    if (area.id) value["id"] = *area.id;
    if (area.kind) value["kind"] = *area.kind;
    if (area.role) value["role"] = *area.role;
    if (area.sectionId) value["sectionId"] = *area.sectionId;
    return value;
}

Json::Value toJson(const PageEntry& page) {
    Json::Value value(Json::objectValue);
    value["pageIndex"] = page.pageIndex;
    value["break"] = toJson(page.breakInfo);
    value["metrics"] = toJson(page.metrics);
    value["pageTopOffsetPx"] = page.pageTopOffsetPx;
    value["pageGapPx"] = page.pageGapPx;
    setIfPresent(value, "pageBottomSpacingPx", page.pageBottomSpacingPx);

    Json::Value areas(Json::objectValue);
    areas["header"] = toJson(page.headerFooterAreas.header);
    areas["footer"] = toJson(page.headerFooterAreas.footer);
    value["headerFooterAreas"] = areas;

    value["contentArea"] = toJson(page.contentArea);
    value["spacingAfterPx"] = page.spacingAfterPx;

    Json::Value segments(Json::arrayValue);
    for (int pos : page.spacingSegments) {
        segments.append(pos);
    }
    value["spacingSegments"] = segments;
    return value;
}

Json::Value toJson(const FieldSegment& field) {
    Json::Value value(Json::objectValue);
    value["pos"] = field.pos;
    value["nodeSize"] = field.nodeSize;

    value["attrs"] = field.attrs.isObject() ? field.attrs : Json::Value(Json::objectValue);

    Json::Value rect(Json::objectValue);
    rect["leftPx"] = field.leftPx;
    rect["widthPx"] = field.widthPx;
    rect["topPx"] = field.topPx;
    rect["heightPx"] = field.heightPx;
    value["rect"] = rect;

    Json::Value segments(Json::arrayValue);
    for (const auto& segment : field.segments) {
        segments.append(toJson(segment));
    }
    value["segments"] = segments;
    return value;
}

Json::Value toJson(const PaginationResult& result) {
    Json::Value value(Json::objectValue);
    value["document"] = result.document;
    value["units"] = toJson(result.units);

    Json::Value pages(Json::arrayValue);
    for (const auto& page : result.pages) {
        pages.append(toJson(page));
    }
    value["pages"] = pages;

    Json::Value fields(Json::arrayValue);
    for (const auto& field : result.fieldSegments) {
        fields.append(toJson(field));
    }
    value["fieldSegments"] = fields;

    if (!result.warnings.empty()) {
        Json::Value warnings(Json::arrayValue);
        for (auto warning : result.warnings) {
            warnings.append(toString(warning));
        }
        value["warnings"] = warnings;
    }
    return value;
}

std::string toJsonString(const PaginationResult& result) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, toJson(result));
}

} // namespace pageflow
