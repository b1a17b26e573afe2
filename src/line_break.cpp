#include "pageflow/line_break.h"
#include "pageflow/log.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>

namespace pageflow {

namespace {

// ── Text inspection ──────────────────────────────────────────────────

bool isAsciiLetter(char32_t c) {
    return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z');
}

/// Punctuation that ends a word for the purpose of rewinding a break
bool isWordBoundaryPunctuation(char32_t c) {
    return c != 0 && c < 0x80 && std::strchr(".,;:!?-()[]{}", static_cast<char>(c)) != nullptr;
}

bool isSpace(char32_t c) {
    if (c < 0x80) return std::isspace(static_cast<unsigned char>(c)) != 0;
    return c == 0x00A0 || (c >= 0x2000 && c <= 0x200B) || c == 0x202F || c == 0x3000;
}

/// Characters on either side of `pos` within its parent's text.
/// 0 stands for "no character".
struct Surroundings {
    char32_t before = 0;
    char32_t after = 0;
    int parentOffset = 0;
};

std::optional<Surroundings> surroundingsAt(const Document& doc, int pos) {
    auto resolved = doc.resolve(pos);
    if (!resolved) return std::nullopt;

    const DocNode& parent = resolved->parent();
    int offset = resolved->parentOffset();

    Surroundings result;
    result.parentOffset = offset;
    if (offset > 0) result.before = parent.charAt(offset - 1);
    result.after = parent.charAt(offset);
    return result;
}

// ── Position helpers ─────────────────────────────────────────────────

int clampPosWithinBlock(int pos, int blockPos, const DocNode& blockNode, int minPos) {
    int blockSize = std::max(0, blockNode.nodeSize());
    int blockStart = std::max(blockPos + 1, minPos);
    int blockEnd = blockPos + blockSize - 1;
    return std::min(blockEnd, std::max(blockStart, pos));
}

std::optional<int> probe(const MeasurementView& view, const std::vector<Point>& points) {
    for (const auto& point : points) {
        if (auto pos = view.posFromPoint(point)) return pos;
    }
    return std::nullopt;
}

} // anonymous namespace

// ── Line grouping ────────────────────────────────────────────────────

std::optional<Rect> normalizeLineRect(const Rect& rect) {
    if (!std::isfinite(rect.top) || !std::isfinite(rect.bottom)) return std::nullopt;

    float width = std::isfinite(rect.width) ? rect.width : rect.right - rect.left;
    float height = std::isfinite(rect.height) ? rect.height : rect.bottom - rect.top;
    if (!std::isfinite(width) || width <= 0 || !std::isfinite(height) || height <= 0) {
        return std::nullopt;
    }

    Rect normalized;
    normalized.top = rect.top;
    normalized.bottom = rect.bottom;
    normalized.left = std::isfinite(rect.left) ? rect.left : rect.right - width;
    normalized.right = std::isfinite(rect.right) ? rect.right : rect.left + width;
    normalized.width = width;
    normalized.height = height;
    return normalized;
}

std::vector<Rect> groupLineRects(std::vector<Rect> rects) {
    std::sort(rects.begin(), rects.end(), [](const Rect& a, const Rect& b) {
        return a.top == b.top ? a.left < b.left : a.top < b.top;
    });

    std::vector<Rect> lines;
    for (const auto& rect : rects) {
        if (!lines.empty()) {
            Rect& current = lines.back();
            if (std::fabs(current.top - rect.top) <= kLineGroupTolerancePx &&
                std::fabs(current.bottom - rect.bottom) <= kLineGroupTolerancePx) {
                current.top = std::min(current.top, rect.top);
                current.bottom = std::max(current.bottom, rect.bottom);
                current.left = std::min(current.left, rect.left);
                current.right = std::max(current.right, rect.right);
                current.width = std::max(current.right - current.left, current.width);
                current.height = std::max(current.bottom - current.top, current.height);
                continue;
            }
        }
        lines.push_back(rect);
    }
    return lines;
}

std::vector<Point> resolveSamplePoints(const Rect& line) {
    float width = std::max(line.width, 0.5f);
    float height = std::max(line.height, 0.5f);
    float top = line.top;
    float bottom = line.bottom;

    auto clampLeft = [&](float left) {
        return std::min(std::max(left, line.left + 0.25f), line.right - 0.25f);
    };

    float safeTop = std::min(std::max(top + std::min(1.0f, height / 2), top + 0.25f), bottom - 0.25f);

    std::vector<Point> samples;
    samples.push_back({clampLeft(line.left + 1), safeTop});

    std::vector<float> ratios;
    if (width >= 6) {
        ratios = {0.1f, 0.4f, 0.7f, 0.9f};
    } else if (width >= 3) {
        ratios = {0.2f, 0.5f, 0.8f};
    } else {
        ratios = {0.5f};
    }
    for (float ratio : ratios) {
        samples.push_back({clampLeft(line.left + width * ratio), safeTop});
    }

    float verticalCenter = top + height / 2;
    samples.push_back({clampLeft(line.left + width / 2),
                       std::min(std::max(verticalCenter, top + 0.25f), bottom - 0.25f)});
    return samples;
}

// ── Break search ─────────────────────────────────────────────────────

std::optional<LineBreakResult> findLineBreakInBlock(const MeasurementView& view,
                                                    int blockPos,
                                                    const DocNode& blockNode,
                                                    float boundaryY,
                                                    int minPos) {
    if (!std::isfinite(boundaryY)) return std::nullopt;

    auto element = view.elementAtPos(blockPos);
    if (!element) return std::nullopt;

    std::vector<Rect> normalized;
    for (const auto& rect : view.lineRects(*element)) {
        if (auto line = normalizeLineRect(rect)) normalized.push_back(*line);
    }
    auto lines = groupLineRects(std::move(normalized));
    if (lines.empty()) return std::nullopt;

    if (lines.back().bottom <= boundaryY + kLineGroupTolerancePx) {
        return std::nullopt;
    }

    auto overflowLine = std::find_if(lines.begin(), lines.end(), [&](const Rect& line) {
        return line.bottom > boundaryY + kLineGroupTolerancePx;
    });
    if (overflowLine == lines.end()) return std::nullopt;

    // Left edge of the overflowing line first, then spread samples
    Point leftEdge{overflowLine->left + 0.5f,
                   overflowLine->top + std::max((overflowLine->bottom - overflowLine->top) / 2, 0.5f)};
    auto pos = view.posFromPoint(leftEdge);
    if (!pos) {
        pos = probe(view, resolveSamplePoints(*overflowLine));
    }

    int blockStart = std::max(blockPos + 1, minPos);
    if (!pos) {
        // Retry across the horizontal extent of the first inline element
        if (auto inlineElement = view.elementAtPos(blockStart)) {
            Rect line = *overflowLine;
            if (auto inlineRect = view.elementRect(*inlineElement)) {
                line.left = inlineRect->left;
                line.right = inlineRect->right;
            }
            pos = probe(view, resolveSamplePoints(line));
        }
    }
    if (!pos) {
        PF_LOGD("findLineBreakInBlock: block=%d no position on overflow line top=%.1f",
                blockPos, overflowLine->top);
        return std::nullopt;
    }

    int clampedPos = clampPosWithinBlock(*pos, blockPos, blockNode, minPos);

    bool isMidWord = false;
    if (auto around = surroundingsAt(view.doc(), clampedPos)) {
        isMidWord = isAsciiLetter(around->before) && isAsciiLetter(around->after);
    }

    // Rewind to the start of the line (end of the previous one)
    int finalBreakPos = clampedPos;
    auto sampledRect = view.rectAtPos(clampedPos);
    if (sampledRect) {
        float sampledTop = sampledRect->top;
        int checkPos = clampedPos;
        for (int i = 0; i < kLineRewindLimit && checkPos > blockStart; ++i) {
            --checkPos;

            auto checkRect = view.rectAtPos(checkPos);
            if (checkRect && std::fabs(checkRect->top - sampledTop) > kLineChangeThresholdPx) {
                finalBreakPos = checkPos + 1;
                break;
            }

            if (isMidWord) {
                if (auto around = surroundingsAt(view.doc(), checkPos)) {
                    char32_t before = around->before;
                    bool isWordBoundary = before == 0 ||
                                          isSpace(before) ||
                                          isWordBoundaryPunctuation(before) ||
                                          around->parentOffset == 0;
                    if (isWordBoundary) {
                        finalBreakPos = checkPos;
                        break;
                    }
                }
            }

            if (checkPos <= blockStart) {
                finalBreakPos = blockStart;
                break;
            }
        }
    }

    LineBreakResult result;
    result.pos = finalBreakPos;
    auto finalRect = view.rectAtPos(finalBreakPos);
    result.top = finalRect ? finalRect->top : overflowLine->top;
    result.bottom = finalRect ? finalRect->bottom : overflowLine->bottom;

    PF_LOGD("findLineBreakInBlock: block=%d boundary=%.1f pos=%d top=%.1f",
            blockPos, boundaryY, result.pos, result.top);
    return result;
}

} // namespace pageflow
