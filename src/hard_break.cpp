#include "pageflow/hard_break.h"
#include "pageflow/log.h"
#include <cmath>
#include <exception>

namespace pageflow {

namespace {

void recordCandidate(const MeasurementView& view,
                     ElementHandle marker,
                     std::optional<ElementHandle> fallbackElement,
                     const Rect& containerRect,
                     float lowerBound,
                     float upperBound,
                     std::optional<BreakCandidate>& best) {
    auto rect = view.elementRect(marker);
    if (!rect) return;

    float relativeTop = rect->top - containerRect.top;
    float relativeBottom = rect->bottom - containerRect.top;
    if (!std::isfinite(relativeTop) || relativeTop <= lowerBound || relativeTop > upperBound) {
        return;
    }

    auto pos = view.posFromElement(marker, 0);
    if (pos) {
        pos = extendBreakPositionWithSectionMarkers(view.doc(), *pos);
    }

    std::optional<float> resolvedBottom;
    if (std::isfinite(relativeBottom) && relativeBottom > relativeTop) {
        resolvedBottom = relativeBottom;
    }
    if (!resolvedBottom && fallbackElement) {
        if (auto fallbackRect = view.elementRect(*fallbackElement)) {
            float fallbackBottom = fallbackRect->bottom - containerRect.top;
            if (std::isfinite(fallbackBottom) && fallbackBottom > relativeTop) {
                resolvedBottom = fallbackBottom;
            }
        }
    }

    if (!best || relativeTop < best->top) {
        best = BreakCandidate{relativeTop, resolvedBottom.value_or(relativeTop), pos};
    }
}

} // anonymous namespace

std::optional<BreakCandidate> checkForHardBreak(const MeasurementView& view,
                                                ElementHandle element,
                                                const Rect& containerRect,
                                                float lowerBound,
                                                float upperBound) {
    auto& geometry = view.geometry();
    std::optional<BreakCandidate> best;

    bool isMarker = false;
    std::vector<ElementHandle> markers;
    try {
        isMarker = geometry.isPageBreakMarker(element);
        if (!isMarker) {
            markers = geometry.pageBreakMarkersWithin(element);
        }
    } catch (const std::exception& e) {
        PF_LOGD("checkForHardBreak: element=%d marker lookup failed: %s", element, e.what());
        return std::nullopt;
    }

    if (isMarker) {
        std::optional<ElementHandle> previous;
        try {
            previous = geometry.previousSibling(element);
        } catch (const std::exception& e) {
            PF_LOGD("checkForHardBreak: element=%d sibling lookup failed: %s", element, e.what());
        }
        recordCandidate(view, element, previous, containerRect, lowerBound, upperBound, best);
    } else {
        for (ElementHandle marker : markers) {
            recordCandidate(view, marker, element, containerRect, lowerBound, upperBound, best);
        }
    }

    if (best) {
        PF_LOGD("checkForHardBreak: element=%d top=%.1f bottom=%.1f pos=%d",
                element, best->top, best->bottom, best->pos.value_or(-1));
    }
    return best;
}

} // namespace pageflow
