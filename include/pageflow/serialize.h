#pragma once

#include "pageflow/page.h"
#include <string>

#include <json/json.h>

namespace pageflow {

/// Renderer contract of a pagination result.
/// Field names are camelCase and every length is in px at 96 DPI.
Json::Value toJson(const PaginationResult& result);

Json::Value toJson(const PageEntry& page);
Json::Value toJson(const BreakInfo& info);
Json::Value toJson(const PageMetrics& metrics);
Json::Value toJson(const HeaderFooterArea& area);
Json::Value toJson(const FieldSegment& field);

/// Compact single-line JSON text of a pagination result
std::string toJsonString(const PaginationResult& result);

} // namespace pageflow
