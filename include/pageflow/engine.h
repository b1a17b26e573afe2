#pragma once

#include "pageflow/document.h"
#include "pageflow/geometry_provider.h"
#include "pageflow/layout.h"
#include "pageflow/page.h"
#include <memory>
#include <optional>
#include <string>

namespace pageflow {

/// A document snapshot together with the live geometry of its rendering
struct EditorSnapshot {
    std::shared_ptr<const Document> doc;
    std::shared_ptr<GeometryProvider> geometry;
};

/// Caller-supplied page setup. Missing or non-finite values fall back to
/// the defaults in constants.h.
struct PaginationParams {
    std::optional<float> pageHeightPx;
    std::optional<float> pageWidthPx;
    std::optional<PageMargins> marginsPx;
    HeaderFooterResolver resolveHeaderFooter;   // Empty: no headers or footers
};

/// Paginate a snapshot from scratch.
/// Never throws for measurement failures: a missing render surface yields an
/// empty page set, and degraded paths are reported as warnings.
PaginationResult generatePageBreaks(const EditorSnapshot& snapshot,
                                    const PaginationParams& params = {});

/// Main entry point for hosts that repaginate after every edit.
/// Keeps the last document and params so a geometry change can be
/// re-paginated without handing the document over again.
class Engine {
public:
    explicit Engine(std::shared_ptr<GeometryProvider> geometry);
    ~Engine();

    /// Paginate a document against the engine's geometry
    PaginationResult paginate(std::shared_ptr<const Document> doc,
                              const PaginationParams& params = {});

    /// Parse a serialized snapshot and paginate it
    PaginationResult paginateJson(const std::string& json,
                                  const PaginationParams& params = {});

    /// Re-paginate the last document with new params
    PaginationResult repaginate(const PaginationParams& params);

    /// Re-paginate the last document with the last params
    PaginationResult repaginate();

    std::shared_ptr<GeometryProvider> geometry() const;

private:
    std::shared_ptr<GeometryProvider> geometry_;
    std::shared_ptr<const Document> lastDocument_;
    PaginationParams lastParams_;
};

} // namespace pageflow
