#pragma once

#include <functional>
#include <initializer_list>
#include <optional>

namespace pageflow {

/// A rectangle in surface coordinates (CSS px, origin = surface top-left)
struct Rect {
    float top = 0;
    float bottom = 0;
    float left = 0;
    float right = 0;
    float width = 0;
    float height = 0;

    static Rect fromEdges(float top, float bottom, float left, float right) {
        return {top, bottom, left, right, right - left, bottom - top};
    }
};

/// A probe point in surface coordinates
struct Point {
    float left = 0;
    float top = 0;
};

/// Layout offsets of an element, used when bounding rects are unavailable.
/// Any field may be missing on a detached or partially rendered element.
struct OffsetBox {
    std::optional<float> offsetTop;
    std::optional<float> offsetLeft;
    std::optional<float> offsetWidth;
    std::optional<float> offsetHeight;
};

/// A lazily evaluated candidate in a fallback chain
using NumberCandidate = std::function<std::optional<float>()>;

/// True when the value is present and finite
bool isFiniteValue(const std::optional<float>& value);

/// Return `value` when finite, otherwise nullopt
std::optional<float> finiteOrNull(const std::optional<float>& value);

/// Return the first finite value in order, or 0 when none is finite.
float getSafeNumber(std::initializer_list<std::optional<float>> values);

/// Evaluate candidates in order and stop at the first finite result.
/// Later candidates are never invoked once one succeeds.
std::optional<float> firstFinite(std::initializer_list<NumberCandidate> candidates);

/// Next vertical offset for stacking page previews: top + height + gap,
/// with any non-finite input treated as 0.
float computeNextVisualTop(float currentTop, float pageHeightPx, float gapPx);

/// Synthesize a rect from layout offsets when measurement is unavailable
Rect createFallbackRect(const std::optional<OffsetBox>& element);

} // namespace pageflow
