#include "pageflow/engine.h"
#include "pageflow/break_locator.h"
#include "pageflow/field_segments.h"
#include "pageflow/hard_break.h"
#include "pageflow/log.h"
#include "pageflow/measurement_view.h"
#include "pageflow/pagination_state.h"
#include "pageflow/table_overflow.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace pageflow {

namespace {

PageMargins normalizePageMargins(const std::optional<PageMargins>& margins) {
    PageMargins defaults;
    if (!margins) return defaults;

    PageMargins result;
    result.top = getSafeNumber({margins->top, defaults.top});
    result.bottom = getSafeNumber({margins->bottom, defaults.bottom});
    result.left = getSafeNumber({margins->left, defaults.left});
    result.right = getSafeNumber({margins->right, defaults.right});
    return result;
}

void addWarning(std::vector<PaginationWarning>& warnings, PaginationWarning warning) {
    if (std::find(warnings.begin(), warnings.end(), warning) == warnings.end()) {
        warnings.push_back(warning);
    }
}

/// Walks the top-level blocks of one run and drives the pagination state
class Paginator {
public:
    Paginator(const MeasurementView& view,
              const Rect& containerRect,
              LayoutResolver resolveLayout,
              PaginationState& pagination,
              std::vector<PaginationWarning>& warnings)
        : view_(view)
        , containerRect_(containerRect)
        , resolveLayout_(std::move(resolveLayout))
        , pagination_(pagination)
        , warnings_(warnings) {}

    void run() {
        auto blocks = view_.topLevelBlocks();
        while (pagination_.blockIndex >= 0 &&
               pagination_.blockIndex < static_cast<int>(blocks.size())) {
            if (!processBlock(blocks[pagination_.blockIndex])) break;
            pagination_.blockIndex += 1;
        }
    }

private:
    const MeasurementView& view_;
    const Rect& containerRect_;
    LayoutResolver resolveLayout_;
    PaginationState& pagination_;
    std::vector<PaginationWarning>& warnings_;

    bool processBlock(ElementHandle block) {
        float usable = pagination_.pageLayout.usableHeightPx;
        if (!std::isfinite(usable) || usable <= 0) {
            return false;
        }

        auto blockRect = view_.elementRect(block);
        if (!blockRect) {
            PF_LOGD("processBlock: block=%d has no rect, skipping", block);
            return true;
        }

        float blockTop = blockRect->top - containerRect_.top;
        float blockBottom = blockRect->bottom - containerRect_.top;
        float pageLimit = pagination_.pageStart + usable;

        if (blockBottom <= pagination_.pageStart) {
            return true;
        }

        if (auto forced = checkForHardBreak(view_, block, containerRect_, pagination_.pageStart, pageLimit)) {
            handleForcedBreak(*forced);
            return true;
        }

        if (blockBottom > pageLimit) {
            handleBlockOverflow(block, blockTop, pageLimit);
            return true;
        }

        float fittedBottom = std::min(blockBottom, pageLimit);
        float current = pagination_.currentFittedBottomPx.value_or(pagination_.pageStart);
        pagination_.currentFittedBottomPx = std::max(current, fittedBottom);
        return true;
    }

    void handleForcedBreak(const BreakCandidate& forced) {
        pagination_.currentFittedBottomPx = forced.bottom;

        BreakRequest request;
        request.breakTop = forced.bottom;
        request.breakBottom = forced.bottom;
        request.lastFitTop = forced.top;
        request.breakPos = forced.pos;
        recordBreak(pagination_, request, resolveLayout_);
        pagination_.currentFittedBottomPx.reset();
    }

    void handleBlockOverflow(ElementHandle block, float blockTop, float pageLimit) {
        BreakRequest request;
        if (auto exact = getExactBreakPosition(view_, block, containerRect_, pageLimit,
                                               pagination_.searchBounds())) {
            request.breakBottom = exact->fittedBottom;
            request.breakTop = exact->fittedTop;
            request.lastFitTop = exact->fittedTop;
            request.breakPos = exact->pos;
            request.breakY = finiteOrNull(exact->breakY);
        } else if (!fillFromTableRowOverflow(block, pageLimit, request)) {
            float fallbackBottom = blockTop > pagination_.pageStart ? std::min(blockTop, pageLimit) : pageLimit;
            request.breakBottom = fallbackBottom;
            request.breakTop = fallbackBottom;
            request.lastFitTop = fallbackBottom;
            addWarning(warnings_, PaginationWarning::UnresolvedBreak);
            PF_LOGW("processBlock: no break found in block=%d, breaking at %.1f", block, fallbackBottom);
        }

        // A break must move the page start forward
        float resolvedBottom = std::max(request.breakBottom.value_or(pageLimit), pagination_.pageStart);
        float resolvedTop = std::min(request.lastFitTop.value_or(resolvedBottom), resolvedBottom);
        if (resolvedTop <= pagination_.pageStart) {
            PF_LOGW("processBlock: block=%d does not fit on page %d, breaking at page limit %.1f",
                    block, pagination_.pageIndex, pageLimit);
            request.breakBottom = pageLimit;
            request.breakTop = pageLimit;
            request.lastFitTop = pageLimit;
            addWarning(warnings_, PaginationWarning::PageOverflow);
        }

        pagination_.currentFittedBottomPx = request.breakBottom;
        recordBreak(pagination_, request, resolveLayout_);
        pagination_.currentFittedBottomPx.reset();
    }

    bool fillFromTableRowOverflow(ElementHandle block, float pageLimit, BreakRequest& request) {
        auto blockPos = view_.posFromElement(block, 0);
        if (!blockPos) return false;

        float containerTop = containerRect_.top;
        float absoluteBoundary = containerTop + pageLimit;
        int startPos = std::max(*blockPos + 1, pagination_.lastBreakPos + 1);
        auto overflow = findTableRowOverflow(view_, startPos, absoluteBoundary);
        if (!overflow) return false;

        float pageStart = pagination_.pageStart;
        float fittedBottom = std::min(std::max(overflow->breakInfo.bottom - containerTop, pageStart), pageLimit);
        float fittedTop = std::min(std::max(overflow->breakInfo.top - containerTop, pageStart), fittedBottom);

        request.breakBottom = fittedBottom;
        request.breakTop = fittedBottom;
        request.lastFitTop = fittedTop;
        request.breakPos = overflow->breakInfo.pos;
        request.breakY = overflow->breakInfo.top;
        PF_LOGD("processBlock: table row fallback at pos=%d", overflow->breakInfo.pos);
        return true;
    }
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// generatePageBreaks
// ---------------------------------------------------------------------------

PaginationResult generatePageBreaks(const EditorSnapshot& snapshot,
                                    const PaginationParams& params) {
    PaginationResult result;
    result.document = snapshot.doc ? snapshot.doc->toJson() : Json::Value(Json::objectValue);

    if (!snapshot.geometry) {
        PF_LOGW("generatePageBreaks: no geometry provider");
        result.warnings.push_back(PaginationWarning::NoRenderSurface);
        return result;
    }

    Document emptyDocument;
    const Document& doc = snapshot.doc ? *snapshot.doc : emptyDocument;
    MeasurementView view(doc, *snapshot.geometry);

    if (!view.hasRenderSurface()) {
        PF_LOGW("generatePageBreaks: no render surface, returning empty page set");
        result.warnings.push_back(PaginationWarning::NoRenderSurface);
        return result;
    }

    float pageHeightPx = getSafeNumber({params.pageHeightPx, kDefaultPageHeightPx});
    PageMargins baseMarginsPx = normalizePageMargins(params.marginsPx);

    Rect containerRect = view.containerRect();
    float pageWidthPx = resolvePageWidthPx(params.pageWidthPx, containerRect, view.containerOffsets());
    float contentWidthPx = resolveContentWidthPx(pageWidthPx, baseMarginsPx, containerRect);

    PF_LOGI("generatePageBreaks: size=%d page=%.0fx%.0f margins=%.0f/%.0f/%.0f/%.0f",
            view.docSize(), pageWidthPx, pageHeightPx,
            baseMarginsPx.top, baseMarginsPx.right, baseMarginsPx.bottom, baseMarginsPx.left);

    LayoutResolver resolveLayout = createLayoutResolver(params.resolveHeaderFooter, baseMarginsPx, pageHeightPx);
    NormalizedLayout initialLayout = resolveLayout(0, PageLayoutOptions{false});

    PaginationState pagination;
    pagination.baseMarginsPx = baseMarginsPx;
    pagination.pageHeightPx = getSafeNumber({initialLayout.pageHeightPx, pageHeightPx});
    pagination.pageWidthPx = pageWidthPx;
    pagination.contentWidthPx = contentWidthPx;
    pagination.pageGapPx = getSafeNumber({initialLayout.pageGapPx, kDefaultPageGapPx});
    pagination.docEndPos = view.docSize();
    pagination.pageLayout = initialLayout;

    addFirstPage(pagination, initialLayout);

    if (initialLayout.usableHeightPx > 0) {
        Paginator paginator(view, containerRect, resolveLayout, pagination, result.warnings);
        paginator.run();
    } else {
        PF_LOGW("generatePageBreaks: margins leave no usable height (page=%.0f)", pageHeightPx);
        result.warnings.push_back(PaginationWarning::NoUsableHeight);
    }

    finalizeTrailingPage(pagination);
    result.pages = finalizePages(pagination, resolveLayout, view);
    result.fieldSegments = computeHtmlFieldSegments(view, containerRect, result.pages);

    PF_LOGI("generatePageBreaks: pages=%zu fields=%zu warnings=%zu",
            result.pages.size(), result.fieldSegments.size(), result.warnings.size());
    return result;
}

// ---------------------------------------------------------------------------
// Engine
// ---------------------------------------------------------------------------

Engine::Engine(std::shared_ptr<GeometryProvider> geometry)
    : geometry_(std::move(geometry)) {}

Engine::~Engine() = default;

PaginationResult Engine::paginate(std::shared_ptr<const Document> doc,
                                  const PaginationParams& params) {
    lastDocument_ = std::move(doc);
    lastParams_ = params;
    return generatePageBreaks(EditorSnapshot{lastDocument_, geometry_}, params);
}

PaginationResult Engine::paginateJson(const std::string& json,
                                      const PaginationParams& params) {
    std::shared_ptr<const Document> doc;
    try {
        doc = std::make_shared<const Document>(parseDocumentJson(json));
    } catch (const std::exception& e) {
        PF_LOGW("paginateJson: parse failed: %s", e.what());
        PaginationResult result;
        result.document = Json::Value(Json::objectValue);
        result.warnings.push_back(PaginationWarning::ParseError);
        return result;
    }
    return paginate(std::move(doc), params);
}

PaginationResult Engine::repaginate(const PaginationParams& params) {
    lastParams_ = params;
    return repaginate();
}

PaginationResult Engine::repaginate() {
    if (!lastDocument_) {
        PF_LOGW("repaginate: nothing paginated yet");
    }
    return generatePageBreaks(EditorSnapshot{lastDocument_, geometry_}, lastParams_);
}

std::shared_ptr<GeometryProvider> Engine::geometry() const {
    return geometry_;
}

} // namespace pageflow
