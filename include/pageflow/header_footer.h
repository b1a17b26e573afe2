#pragma once

#include "pageflow/layout.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pageflow {

enum class HeaderFooterRole {
    Header,
    Footer,
};

/// A measured header or footer part of the document.
/// `variants` lists the page kinds it applies to: "first", "titlePg",
/// "even", "odd", "last" or "default".
struct HeaderFooterRecord {
    std::string id;
    HeaderFooterRole role = HeaderFooterRole::Header;
    std::vector<std::string> variants;
    float contentHeightPx = 0;
};

/// Catalog of measured header/footer sections keyed by id, with the
/// variant lookup that picks the section shown on a given page.
class HeaderFooterCatalog {
public:
    /// `headerDistancePx`/`footerDistancePx`: distance from the page edge
    /// to the header/footer content
    explicit HeaderFooterCatalog(float headerDistancePx = 0, float footerDistancePx = 0);

    /// Register a record. The first record claiming a variant keeps it;
    /// the first record of each role doubles as its default when no record
    /// claims "default".
    void addRecord(const HeaderFooterRecord& record);

    bool empty() const { return metricsById_.empty(); }

    /// Measurement summary of a section, or nullopt for unknown ids
    std::optional<HeaderFooterMetrics> metricsFor(const std::string& id) const;

    /// Section id displayed on a page. Candidates in order: "first" and
    /// "titlePg" on page 0, "even"/"odd" by page number, "last" on the
    /// final page, then "default".
    std::optional<std::string> resolveSectionId(HeaderFooterRole role,
                                                int pageIndex,
                                                bool isLastPage) const;

    /// Header and footer of a page, usable as a HeaderFooterResolver
    HeaderFooterSections resolveForPage(int pageIndex, const PageLayoutOptions& options) const;

    /// A resolver bound to a copy of this catalog
    HeaderFooterResolver resolver() const;

private:
    float headerDistancePx_;
    float footerDistancePx_;
    std::map<std::string, HeaderFooterMetrics> metricsById_;
    std::map<std::string, std::string> headerVariants_;
    std::map<std::string, std::string> footerVariants_;
    std::optional<std::string> firstHeaderId_;
    std::optional<std::string> firstFooterId_;

    std::optional<HeaderFooterSection> sectionFor(const std::optional<std::string>& id) const;
};

} // namespace pageflow
