#include "pageflow/header_footer.h"
#include "pageflow/log.h"
#include <cmath>

namespace pageflow {

HeaderFooterCatalog::HeaderFooterCatalog(float headerDistancePx, float footerDistancePx)
    : headerDistancePx_(std::isfinite(headerDistancePx) ? headerDistancePx : 0)
    , footerDistancePx_(std::isfinite(footerDistancePx) ? footerDistancePx : 0) {}

void HeaderFooterCatalog::addRecord(const HeaderFooterRecord& record) {
    if (record.id.empty()) {
        PF_LOGW("HeaderFooterCatalog: ignoring record without id");
        return;
    }

    bool isFooter = record.role == HeaderFooterRole::Footer;
    float contentHeight = std::isfinite(record.contentHeightPx) ? record.contentHeightPx : 0;
    float distance = isFooter ? footerDistancePx_ : headerDistancePx_;

    HeaderFooterMetrics metrics;
    metrics.contentHeightPx = contentHeight;
    metrics.distancePx = distance;
    metrics.effectiveHeightPx = contentHeight + distance;
    metricsById_[record.id] = metrics;

    auto& slot = isFooter ? footerVariants_ : headerVariants_;
    for (const auto& variant : record.variants) {
        if (!variant.empty()) {
            slot.emplace(variant, record.id);
        }
    }
    auto& firstId = isFooter ? firstFooterId_ : firstHeaderId_;
    if (!firstId) firstId = record.id;

    PF_LOGD("HeaderFooterCatalog: %s '%s' content=%.1f effective=%.1f",
            isFooter ? "footer" : "header", record.id.c_str(),
            contentHeight, contentHeight + distance);
}

std::optional<HeaderFooterMetrics> HeaderFooterCatalog::metricsFor(const std::string& id) const {
    auto it = metricsById_.find(id);
    if (it == metricsById_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> HeaderFooterCatalog::resolveSectionId(HeaderFooterRole role,
                                                                 int pageIndex,
                                                                 bool isLastPage) const {
    bool isFooter = role == HeaderFooterRole::Footer;
    const auto& slot = isFooter ? footerVariants_ : headerVariants_;

    int pageNumber = pageIndex + 1;
    std::vector<const char*> candidates;
    if (pageIndex == 0) {
        candidates.push_back("first");
        candidates.push_back("titlePg");
    }
    candidates.push_back(pageNumber % 2 == 0 ? "even" : "odd");
    if (isLastPage) {
        candidates.push_back("last");
    }
    candidates.push_back("default");

    for (const char* variant : candidates) {
        auto it = slot.find(variant);
        if (it != slot.end()) return it->second;
    }
    // Without an explicit default the first registered record stands in
    return isFooter ? firstFooterId_ : firstHeaderId_;
}

std::optional<HeaderFooterSection> HeaderFooterCatalog::sectionFor(
    const std::optional<std::string>& id) const {
    if (!id) return std::nullopt;

    HeaderFooterSection section;
    section.id = id;
    section.metrics = metricsFor(*id);
    if (section.metrics) {
        section.heightPx = section.metrics->effectiveHeightPx;
    }
    return section;
}

HeaderFooterSections HeaderFooterCatalog::resolveForPage(int pageIndex,
                                                         const PageLayoutOptions& options) const {
    HeaderFooterSections sections;
    sections.header = sectionFor(resolveSectionId(HeaderFooterRole::Header, pageIndex, options.isLastPage));
    sections.footer = sectionFor(resolveSectionId(HeaderFooterRole::Footer, pageIndex, options.isLastPage));
    return sections;
}

HeaderFooterResolver HeaderFooterCatalog::resolver() const {
    HeaderFooterCatalog catalog = *this;
    return [catalog](int pageIndex, const PageLayoutOptions& options)
               -> std::optional<HeaderFooterSections> {
        return catalog.resolveForPage(pageIndex, options);
    };
}

} // namespace pageflow
