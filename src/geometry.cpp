#include "pageflow/geometry.h"
#include <cmath>

namespace pageflow {

bool isFiniteValue(const std::optional<float>& value) {
    return value.has_value() && std::isfinite(*value);
}

std::optional<float> finiteOrNull(const std::optional<float>& value) {
    if (isFiniteValue(value)) return value;
    return std::nullopt;
}

float getSafeNumber(std::initializer_list<std::optional<float>> values) {
    for (const auto& value : values) {
        if (isFiniteValue(value)) {
            return *value;
        }
    }
    return 0;
}

std::optional<float> firstFinite(std::initializer_list<NumberCandidate> candidates) {
    for (const auto& candidate : candidates) {
        if (!candidate) continue;
        auto value = candidate();
        if (isFiniteValue(value)) {
            return value;
        }
    }
    return std::nullopt;
}

float computeNextVisualTop(float currentTop, float pageHeightPx, float gapPx) {
    float safeTop = std::isfinite(currentTop) ? currentTop : 0;
    float safeHeight = std::isfinite(pageHeightPx) ? pageHeightPx : 0;
    float safeGap = std::isfinite(gapPx) ? gapPx : 0;
    return safeTop + safeHeight + safeGap;
}

Rect createFallbackRect(const std::optional<OffsetBox>& element) {
    if (!element) {
        return Rect{};
    }

    float top = getSafeNumber({element->offsetTop});
    float left = getSafeNumber({element->offsetLeft});
    float width = getSafeNumber({element->offsetWidth});
    float height = getSafeNumber({element->offsetHeight});

    Rect rect;
    rect.top = top;
    rect.bottom = top + height;
    rect.left = left;
    rect.right = left + width;
    rect.width = width;
    rect.height = height;
    return rect;
}

} // namespace pageflow
