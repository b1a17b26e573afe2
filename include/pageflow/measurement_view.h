#pragma once

#include "pageflow/document.h"
#include "pageflow/geometry_provider.h"
#include <optional>
#include <vector>

namespace pageflow {

/// A document snapshot paired with the live geometry of its rendering.
/// Every query is exception safe: failures come back as nullopt.
class MeasurementView {
public:
    MeasurementView(const Document& doc, GeometryProvider& geometry)
        : doc_(doc), geometry_(geometry) {}

    const Document& doc() const { return doc_; }
    GeometryProvider& geometry() const { return geometry_; }
    int docSize() const { return doc_.contentSize(); }

    bool hasRenderSurface() const;
    /// Container rect, or one synthesized from its layout offsets
    Rect containerRect() const;
    std::optional<OffsetBox> containerOffsets() const;
    std::vector<ElementHandle> topLevelBlocks() const;

    std::optional<Rect> elementRect(ElementHandle element) const;
    std::optional<int> posFromElement(ElementHandle element, int offset = 0) const;
    std::optional<int> posFromPoint(const Point& point) const;
    /// Caret rect at `pos`
    std::optional<Rect> rectAtPos(int pos) const;
    std::optional<ElementHandle> elementAtPos(int pos) const;
    /// Client rects of the element's inline content; empty on failure
    std::vector<Rect> lineRects(ElementHandle element) const;
    /// Bounding rect of the element rendered for the node at `pos`
    std::optional<Rect> nodeRect(int pos) const;

    /// Node starting at `pos`
    const DocNode* nodeAt(int pos) const { return doc_.nodeAt(pos); }

private:
    const Document& doc_;
    GeometryProvider& geometry_;
};

} // namespace pageflow
