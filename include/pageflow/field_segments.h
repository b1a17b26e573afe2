#pragma once

#include "pageflow/measurement_view.h"
#include "pageflow/page.h"
#include <optional>
#include <vector>

namespace pageflow {

/// True for field annotations rendering raw html content
bool isHtmlFieldNode(const DocNode& node);

/// Visible slice of a field rectangle (container-relative) on one page,
/// or nullopt when the field does not intersect the page's content
std::optional<FieldPageSegment> computePageSegment(const PageEntry& page,
                                                   float fieldTopPx,
                                                   float fieldBottomPx);

/// Split every measurable html field of the document across the pages it
/// spans. Fields that appear on no page are left out.
std::vector<FieldSegment> computeHtmlFieldSegments(const MeasurementView& view,
                                                   const Rect& containerRect,
                                                   const std::vector<PageEntry>& pages);

} // namespace pageflow
