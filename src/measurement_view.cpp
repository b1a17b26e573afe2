#include "pageflow/measurement_view.h"
#include "pageflow/log.h"
#include <cmath>
#include <exception>

namespace pageflow {

namespace {

bool isFiniteRect(const Rect& rect) {
    return std::isfinite(rect.top) && std::isfinite(rect.bottom);
}

} // anonymous namespace

bool MeasurementView::hasRenderSurface() const {
    try {
        return geometry_.hasRenderSurface();
    } catch (const std::exception& e) {
        PF_LOGW("hasRenderSurface: failed: %s", e.what());
    }
    return false;
}

std::optional<OffsetBox> MeasurementView::containerOffsets() const {
    try {
        return geometry_.containerOffsets();
    } catch (const std::exception& e) {
        PF_LOGD("containerOffsets: failed: %s", e.what());
    }
    return std::nullopt;
}

Rect MeasurementView::containerRect() const {
    try {
        auto rect = geometry_.containerRect();
        if (rect && isFiniteRect(*rect)) return *rect;
    } catch (const std::exception& e) {
        PF_LOGD("containerRect: failed: %s", e.what());
    }
    return createFallbackRect(containerOffsets());
}

std::vector<ElementHandle> MeasurementView::topLevelBlocks() const {
    try {
        return geometry_.topLevelBlocks();
    } catch (const std::exception& e) {
        PF_LOGW("topLevelBlocks: failed: %s", e.what());
    }
    return {};
}

std::optional<Rect> MeasurementView::elementRect(ElementHandle element) const {
    try {
        auto rect = geometry_.resolveElementRect(element);
        if (rect && isFiniteRect(*rect)) return rect;
    } catch (const std::exception& e) {
        PF_LOGD("elementRect: element=%d failed: %s", element, e.what());
    }
    return std::nullopt;
}

std::optional<int> MeasurementView::posFromElement(ElementHandle element, int offset) const {
    try {
        return geometry_.resolvePositionFromElement(element, offset);
    } catch (const std::exception& e) {
        PF_LOGD("posFromElement: element=%d failed: %s", element, e.what());
    }
    return std::nullopt;
}

std::optional<int> MeasurementView::posFromPoint(const Point& point) const {
    if (!std::isfinite(point.left) || !std::isfinite(point.top)) return std::nullopt;
    try {
        return geometry_.resolvePositionFromPoint(point);
    } catch (const std::exception& e) {
        PF_LOGD("posFromPoint: (%.1f, %.1f) failed: %s", point.left, point.top, e.what());
    }
    return std::nullopt;
}

std::optional<Rect> MeasurementView::rectAtPos(int pos) const {
    if (pos < 0 || pos > docSize()) return std::nullopt;
    try {
        auto rect = geometry_.resolveRectAtPosition(pos);
        if (rect && isFiniteRect(*rect)) return rect;
    } catch (const std::exception& e) {
        PF_LOGD("rectAtPos: pos=%d failed: %s", pos, e.what());
    }
    return std::nullopt;
}

std::optional<ElementHandle> MeasurementView::elementAtPos(int pos) const {
    try {
        return geometry_.resolveElementAtPosition(pos);
    } catch (const std::exception& e) {
        PF_LOGD("elementAtPos: pos=%d failed: %s", pos, e.what());
    }
    return std::nullopt;
}

std::vector<Rect> MeasurementView::lineRects(ElementHandle element) const {
    try {
        return geometry_.resolveLineRects(element);
    } catch (const std::exception& e) {
        PF_LOGD("lineRects: element=%d failed: %s", element, e.what());
    }
    return {};
}

std::optional<Rect> MeasurementView::nodeRect(int pos) const {
    auto element = elementAtPos(pos);
    if (!element) return std::nullopt;
    return elementRect(*element);
}

} // namespace pageflow
