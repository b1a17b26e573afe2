#pragma once

#include "pageflow/measurement_view.h"
#include <optional>

namespace pageflow {

/// An explicit page-break marker found inside a rendered block.
/// `top`/`bottom` are relative to the container top.
struct BreakCandidate {
    float top = 0;
    float bottom = 0;
    std::optional<int> pos;
};

/// Scan `element` for explicit page-break markers whose relative top lies in
/// (lowerBound, upperBound] and return the earliest one.
///
/// When the element is itself a marker it is the only candidate, and its
/// previous sibling supplies the bottom if the marker has no height.
/// Otherwise every nested marker is considered, with the element itself as
/// the bottom fallback. The marker position is extended past trailing
/// section-break paragraphs.
std::optional<BreakCandidate> checkForHardBreak(const MeasurementView& view,
                                                ElementHandle element,
                                                const Rect& containerRect,
                                                float lowerBound,
                                                float upperBound);

} // namespace pageflow
