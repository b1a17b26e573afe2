#pragma once

#include "pageflow/geometry.h"
#include <optional>
#include <string>
#include <vector>

namespace pageflow {

/// Opaque handle to a rendered element on the host's surface
using ElementHandle = int;

/// Abstract interface for the host render surface.
/// Browser hosts: implement with getBoundingClientRect / posAtDOM / posAtCoords
/// Headless hosts: implement with a precomputed layout snapshot
///
/// All coordinates are surface coordinates in CSS px. Any call may fail;
/// callers treat a thrown std::exception the same as an empty result.
class GeometryProvider {
public:
    virtual ~GeometryProvider() = default;

    /// False when no render surface is attached (nothing can be measured)
    virtual bool hasRenderSurface() const = 0;

    /// Bounding rect of the measurement container holding the rendered flow
    virtual std::optional<Rect> containerRect() = 0;

    /// Layout offsets of the container, used when its rect is unavailable
    virtual std::optional<OffsetBox> containerOffsets() { return std::nullopt; }

    /// Top-level rendered blocks of the flow, in document order
    virtual std::vector<ElementHandle> topLevelBlocks() = 0;

    /// Bounding rect of a rendered element
    virtual std::optional<Rect> resolveElementRect(ElementHandle element) = 0;

    /// Document position at `offset` inside a rendered element.
    /// May throw when the element is not part of the editable content.
    virtual std::optional<int> resolvePositionFromElement(ElementHandle element, int offset) = 0;

    /// Hit-test a surface point into a document position
    virtual std::optional<int> resolvePositionFromPoint(const Point& point) = 0;

    /// Caret rectangle of a document position
    virtual std::optional<Rect> resolveRectAtPosition(int pos) = 0;

    /// Rendered element of the node starting at `pos`
    virtual std::optional<ElementHandle> resolveElementAtPosition(int pos) {
        return std::nullopt;
    }

    /// Client rects of the inline content of an element (one or more per line)
    virtual std::vector<Rect> resolveLineRects(ElementHandle element) { return {}; }

    /// True when the element is an explicit page-break marker
    virtual bool isPageBreakMarker(ElementHandle element) { return false; }

    /// Page-break markers nested inside an element, in document order
    virtual std::vector<ElementHandle> pageBreakMarkersWithin(ElementHandle element) { return {}; }

    /// Previous sibling element, if any
    virtual std::optional<ElementHandle> previousSibling(ElementHandle element) {
        return std::nullopt;
    }
};

} // namespace pageflow
