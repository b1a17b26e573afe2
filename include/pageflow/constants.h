#pragma once

namespace pageflow {

/// CSS pixels per inch used for every measurement the engine reports
constexpr float kPixelsPerInch = 96.0f;

/// US Letter defaults (8.5 x 11 in, 1 in margins)
constexpr float kDefaultPageHeightPx = 11.0f * kPixelsPerInch;
constexpr float kDefaultPageWidthPx = 8.5f * kPixelsPerInch;
constexpr float kDefaultMarginPx = kPixelsPerInch;

/// Gap drawn between stacked page previews
constexpr float kDefaultPageGapPx = 20.0f;

/// Top/bottom margins never shrink below half an inch
constexpr float kMinimumVerticalMarginPx = 48.0f;

} // namespace pageflow
