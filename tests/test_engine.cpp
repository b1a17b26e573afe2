#include <gtest/gtest.h>
#include "pageflow/engine.h"
#include "pageflow/field_segments.h"
#include "pageflow/header_footer.h"
#include "pageflow/serialize.h"
#include "mock_surface.h"
#include <algorithm>
#include <memory>
#include <sstream>
#include <string>

using namespace pageflow;

namespace {

DocNode atomBlock(const std::string& type, std::map<std::string, std::string> attrs = {}) {
    DocNode node = DocNode::block(type, {}, std::move(attrs));
    node.isAtom = true;
    return node;
}

std::shared_ptr<const Document> makeDocument(std::vector<DocNode> blocks) {
    return std::make_shared<const Document>(DocNode::block("doc", std::move(blocks)));
}

/// table > row > [cell > p(20 chars), cell > p(200 chars)]
std::shared_ptr<const Document> tableDocument() {
    auto shortCell = DocNode::block("tableCell", {DocNode::paragraph(std::string(20, 'a'))});
    auto tallCell = DocNode::block("tableCell", {DocNode::paragraph(std::string(200, 'b'))});
    auto row = DocNode::block("tableRow", {shortCell, tallCell});
    return makeDocument({DocNode::block("table", {row})});
}

PaginationParams pageOfHeight(float heightPx) {
    PaginationParams params;
    params.pageHeightPx = heightPx;
    params.pageWidthPx = 816;
    return params;
}

bool hasWarning(const PaginationResult& result, PaginationWarning warning) {
    return std::find(result.warnings.begin(), result.warnings.end(), warning) != result.warnings.end();
}

} // namespace

// MARK: - Basic pagination

TEST(EngineTest, ShortDocumentFitsOnOnePage) {
    auto doc = makeDocument({DocNode::paragraph("aaaaa"), DocNode::paragraph("bbbbb"), DocNode::paragraph("ccccc")});
    auto surface = std::make_shared<MockGeometryProvider>();
    surface->layoutDocument(*doc);

    auto result = generatePageBreaks(EditorSnapshot{doc, surface}, pageOfHeight(600));

    ASSERT_EQ(result.pages.size(), 1u);
    const auto& page = result.pages[0];
    EXPECT_EQ(page.pageIndex, 0);
    EXPECT_EQ(page.breakInfo.pos, 21);
    EXPECT_FLOAT_EQ(page.breakInfo.startOffsetPx, 0);
    EXPECT_FLOAT_EQ(*page.breakInfo.fittedBottom, 60);
    EXPECT_FLOAT_EQ(*page.contentArea.usableHeightPx, 408);
    EXPECT_FLOAT_EQ(*page.pageBottomSpacingPx, 348);
    EXPECT_FLOAT_EQ(page.spacingAfterPx, 0);
    EXPECT_FLOAT_EQ(page.metrics.pageWidthPx, 816);
    EXPECT_FLOAT_EQ(page.metrics.contentWidthPx, 624);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(result.document["content"].size(), 1u);
}

TEST(EngineTest, LongParagraphSplitsAtLineStart) {
    auto doc = makeDocument({DocNode::paragraph(std::string(400, 'x'))});
    auto surface = std::make_shared<MockGeometryProvider>();
    surface->layoutDocument(*doc);

    // 300 - 96 - 96 leaves 108px: five full lines fit
    auto result = generatePageBreaks(EditorSnapshot{doc, surface}, pageOfHeight(300));

    ASSERT_EQ(result.pages.size(), 2u);
    const auto& first = result.pages[0];
    EXPECT_EQ(first.breakInfo.pos, 201);
    EXPECT_FLOAT_EQ(*first.breakInfo.top, 100);
    EXPECT_FLOAT_EQ(*first.breakInfo.bottom, 108);
    ASSERT_TRUE(first.breakInfo.breakY.has_value());
    EXPECT_FLOAT_EQ(*first.breakInfo.breakY, 100);
    EXPECT_FLOAT_EQ(*first.pageBottomSpacingPx, 8);
    EXPECT_FLOAT_EQ(first.spacingAfterPx, 8 + 96 + 96 + 20);
    EXPECT_EQ(first.spacingSegments, std::vector<int>({201}));

    const auto& second = result.pages[1];
    EXPECT_FLOAT_EQ(second.breakInfo.startOffsetPx, 100);
    EXPECT_EQ(second.breakInfo.pos, 402);
    EXPECT_FLOAT_EQ(second.pageTopOffsetPx, 320);
    EXPECT_TRUE(result.warnings.empty());
}

TEST(EngineTest, PageStartsNeverMoveBackward) {
    auto doc = makeDocument({
        DocNode::paragraph(std::string(400, 'x')),
        DocNode::paragraph(std::string(100, 'y')),
        DocNode::paragraph(std::string(300, 'z')),
    });
    auto surface = std::make_shared<MockGeometryProvider>();
    surface->layoutDocument(*doc);

    auto result = generatePageBreaks(EditorSnapshot{doc, surface}, pageOfHeight(300));

    ASSERT_GT(result.pages.size(), 2u);
    for (size_t i = 1; i < result.pages.size(); ++i) {
        const auto& previous = result.pages[i - 1];
        const auto& current = result.pages[i];
        EXPECT_EQ(current.pageIndex, static_cast<int>(i));
        EXPECT_GT(current.breakInfo.startOffsetPx, previous.breakInfo.startOffsetPx);
        EXPECT_GE(current.breakInfo.pos, previous.breakInfo.pos);
        EXPECT_LE(*previous.breakInfo.fittedBottom,
                  previous.breakInfo.startOffsetPx + *previous.contentArea.usableHeightPx);
    }
    EXPECT_EQ(result.pages.back().breakInfo.pos, doc->contentSize());
}

// MARK: - Forced breaks

TEST(EngineTest, PageBreakMarkerStartsNewPage) {
    auto doc = makeDocument({DocNode::paragraph("a"), atomBlock("pageBreak"), DocNode::paragraph("b")});
    auto surface = std::make_shared<MockGeometryProvider>();
    surface->layoutDocument(*doc);

    auto result = generatePageBreaks(EditorSnapshot{doc, surface});

    ASSERT_EQ(result.pages.size(), 2u);
    EXPECT_EQ(result.pages[0].breakInfo.pos, 3);
    EXPECT_FLOAT_EQ(*result.pages[0].breakInfo.top, 20);
    EXPECT_FLOAT_EQ(*result.pages[0].breakInfo.bottom, 22);
    EXPECT_FLOAT_EQ(result.pages[1].breakInfo.startOffsetPx, 20);
    EXPECT_EQ(result.pages[1].breakInfo.pos, 7);
}

TEST(EngineTest, ForcedBreakBeatsOverflow) {
    auto quote = DocNode::block("blockquote", {
        DocNode::paragraph("a"), atomBlock("pageBreak"), DocNode::paragraph(std::string(400, 'x')),
    });
    auto doc = makeDocument({quote});
    auto surface = std::make_shared<MockGeometryProvider>();
    surface->layoutDocument(*doc);

    auto result = generatePageBreaks(EditorSnapshot{doc, surface}, pageOfHeight(300));

    ASSERT_GE(result.pages.size(), 2u);
    EXPECT_FLOAT_EQ(*result.pages[0].breakInfo.top, 20);
    EXPECT_FLOAT_EQ(*result.pages[0].breakInfo.fittedBottom, 22);
}

// MARK: - Tables

TEST(EngineTest, TableRowSplitsAcrossPages) {
    auto doc = tableDocument();
    auto surface = std::make_shared<MockGeometryProvider>();
    surface->layoutDocument(*doc);

    PaginationParams params = pageOfHeight(146);
    params.marginsPx = PageMargins{48, 48, 96, 96};
    auto result = generatePageBreaks(EditorSnapshot{doc, surface}, params);

    ASSERT_EQ(result.pages.size(), 3u);
    EXPECT_FLOAT_EQ(*result.pages[0].contentArea.usableHeightPx, 50);

    EXPECT_EQ(result.pages[0].breakInfo.pos, 108);
    EXPECT_EQ(result.pages[0].spacingSegments, std::vector<int>({25, 108}));
    EXPECT_FLOAT_EQ(result.pages[1].breakInfo.startOffsetPx, 40);
    EXPECT_EQ(result.pages[1].breakInfo.pos, 188);
    EXPECT_EQ(result.pages[1].spacingSegments, std::vector<int>({25, 188}));
    EXPECT_FLOAT_EQ(result.pages[2].breakInfo.startOffsetPx, 80);
    EXPECT_EQ(result.pages[2].breakInfo.pos, 232);
    EXPECT_TRUE(result.pages[2].spacingSegments.empty());
}

// MARK: - Headers and footers

TEST(EngineTest, HeaderHeightShrinksContentArea) {
    HeaderFooterCatalog catalog(40, 30);
    catalog.addRecord({"hdr", HeaderFooterRole::Header, {"default"}, 100});

    auto doc = makeDocument({DocNode::paragraph("abc")});
    auto surface = std::make_shared<MockGeometryProvider>();
    surface->layoutDocument(*doc);

    PaginationParams params;
    params.resolveHeaderFooter = catalog.resolver();
    auto result = generatePageBreaks(EditorSnapshot{doc, surface}, params);

    ASSERT_EQ(result.pages.size(), 1u);
    const auto& page = result.pages[0];
    EXPECT_FLOAT_EQ(page.metrics.marginTopPx, 140);
    EXPECT_FLOAT_EQ(page.metrics.marginBottomPx, 96);
    EXPECT_FLOAT_EQ(*page.contentArea.usableHeightPx, 820);
    EXPECT_EQ(page.headerFooterAreas.header.id, std::optional<std::string>("hdr"));
    EXPECT_FLOAT_EQ(page.headerFooterAreas.header.reservedHeightPx, 140);
}

// MARK: - Html fields

TEST(EngineTest, HtmlFieldSegments) {
    DocNode fieldNode = atomBlock("fieldAnnotation", {{"type", "html"}});
    fieldNode.attrs["width"] = 300;
    fieldNode.attrs["size"]["height"] = 200;
    auto doc = makeDocument({DocNode::paragraph("a"), fieldNode});
    auto surface = std::make_shared<MockGeometryProvider>();
    MockGeometryProvider::LayoutOptions options;
    options.atomHeightPx = 200;
    surface->layoutDocument(*doc, options);

    auto result = generatePageBreaks(EditorSnapshot{doc, surface});

    ASSERT_EQ(result.fieldSegments.size(), 1u);
    const auto& field = result.fieldSegments[0];
    EXPECT_EQ(field.pos, 3);
    EXPECT_EQ(field.nodeSize, 1);
    EXPECT_FLOAT_EQ(field.topPx, 20);
    EXPECT_FLOAT_EQ(field.heightPx, 200);
    EXPECT_EQ(field.attrs["type"].asString(), "html");
    EXPECT_TRUE(field.attrs["width"].isInt());
    EXPECT_EQ(field.attrs["size"]["height"].asInt(), 200);
    ASSERT_EQ(field.segments.size(), 1u);
    // The field starts inside the top margin band of the page
    EXPECT_EQ(field.segments[0].pageIndex, 0);
    EXPECT_FLOAT_EQ(field.segments[0].topPx, 0);
    EXPECT_FLOAT_EQ(field.segments[0].heightPx, 124);
    EXPECT_FLOAT_EQ(field.segments[0].offsetWithinFieldPx, 76);
}

TEST(EngineTest, OtherFieldsAreIgnored) {
    auto doc = makeDocument({atomBlock("fieldAnnotation", {{"type", "text"}})});
    auto surface = std::make_shared<MockGeometryProvider>();
    surface->layoutDocument(*doc);

    auto result = generatePageBreaks(EditorSnapshot{doc, surface});
    EXPECT_TRUE(result.fieldSegments.empty());
}

TEST(FieldSegmentTest, SegmentRelativeToContentTop) {
    PageEntry page;
    page.pageIndex = 2;
    page.breakInfo.startOffsetPx = 0;
    page.breakInfo.fittedBottom = 500;
    page.metrics.contentHeightPx = 864;
    page.metrics.marginTopPx = 96;

    auto inside = computePageSegment(page, 150, 250);
    ASSERT_TRUE(inside.has_value());
    EXPECT_EQ(inside->pageIndex, 2);
    EXPECT_FLOAT_EQ(inside->topPx, 54);
    EXPECT_FLOAT_EQ(inside->heightPx, 100);
    EXPECT_FLOAT_EQ(inside->offsetWithinFieldPx, 0);

    auto cut = computePageSegment(page, 450, 600);
    ASSERT_TRUE(cut.has_value());
    EXPECT_FLOAT_EQ(cut->topPx, 354);
    EXPECT_FLOAT_EQ(cut->heightPx, 50);
    EXPECT_FLOAT_EQ(cut->absoluteBottomPx, 500);

    EXPECT_FALSE(computePageSegment(page, 600, 700).has_value());
}

// MARK: - Degraded paths

TEST(EngineTest, NoRenderSurfaceYieldsNoPages) {
    auto doc = makeDocument({DocNode::paragraph("abc")});
    auto surface = std::make_shared<MockGeometryProvider>();
    surface->renderSurface = false;

    auto result = generatePageBreaks(EditorSnapshot{doc, surface});
    EXPECT_TRUE(result.pages.empty());
    EXPECT_TRUE(result.fieldSegments.empty());
    EXPECT_EQ(result.document["content"][0]["content"][0]["text"].asString(), "abc");
    EXPECT_TRUE(hasWarning(result, PaginationWarning::NoRenderSurface));

    auto withoutGeometry = generatePageBreaks(EditorSnapshot{doc, nullptr});
    EXPECT_TRUE(withoutGeometry.pages.empty());
    EXPECT_TRUE(hasWarning(withoutGeometry, PaginationWarning::NoRenderSurface));
}

TEST(EngineTest, MarginsLeavingNoRoom) {
    auto doc = makeDocument({DocNode::paragraph("abc")});
    auto surface = std::make_shared<MockGeometryProvider>();
    surface->layoutDocument(*doc);

    auto result = generatePageBreaks(EditorSnapshot{doc, surface}, pageOfHeight(100));
    ASSERT_EQ(result.pages.size(), 1u);
    EXPECT_TRUE(hasWarning(result, PaginationWarning::NoUsableHeight));
}

TEST(EngineTest, UnmappableBlockStillAdvances) {
    auto doc = makeDocument({DocNode::paragraph("a")});
    auto surface = std::make_shared<MockGeometryProvider>();
    surface->blocks.push_back(surface->addElement(0, Rect::fromEdges(0, 500, 0, 400)));
    surface->failPositionFromElement = true;

    auto result = generatePageBreaks(EditorSnapshot{doc, surface}, pageOfHeight(300));

    ASSERT_EQ(result.pages.size(), 5u);
    for (size_t i = 1; i < result.pages.size(); ++i) {
        EXPECT_FLOAT_EQ(result.pages[i].breakInfo.startOffsetPx, 108.0f * i);
    }
    EXPECT_TRUE(hasWarning(result, PaginationWarning::UnresolvedBreak));
}

TEST(EngineTest, OversizedAtomTerminates) {
    auto doc = makeDocument({atomBlock("image")});
    auto surface = std::make_shared<MockGeometryProvider>();
    MockGeometryProvider::LayoutOptions options;
    options.atomHeightPx = 300;
    surface->layoutDocument(*doc, options);

    auto result = generatePageBreaks(EditorSnapshot{doc, surface}, pageOfHeight(300));

    ASSERT_EQ(result.pages.size(), 3u);
    EXPECT_FLOAT_EQ(result.pages[1].breakInfo.startOffsetPx, 108);
    EXPECT_FLOAT_EQ(result.pages[2].breakInfo.startOffsetPx, 216);
    EXPECT_FALSE(result.warnings.empty());
}

TEST(EngineTest, RepeatedRunsAreIdentical) {
    auto doc = tableDocument();
    auto surface = std::make_shared<MockGeometryProvider>();
    surface->layoutDocument(*doc);

    PaginationParams params = pageOfHeight(146);
    params.marginsPx = PageMargins{48, 48, 96, 96};
    auto first = generatePageBreaks(EditorSnapshot{doc, surface}, params);
    auto second = generatePageBreaks(EditorSnapshot{doc, surface}, params);
    EXPECT_EQ(toJsonString(first), toJsonString(second));
}

// MARK: - Engine

TEST(EngineTest, PaginateJsonDocument) {
    const std::string json =
        R"({"type":"doc","content":[{"type":"paragraph","content":[{"type":"text","text":"abc"}]}]})";
    auto surface = std::make_shared<MockGeometryProvider>();
    surface->layoutDocument(parseDocumentJson(json));
    Engine engine(surface);

    auto result = engine.paginateJson(json);
    ASSERT_EQ(result.pages.size(), 1u);
    EXPECT_EQ(result.pages[0].breakInfo.pos, 5);
    EXPECT_EQ(result.document["type"].asString(), "doc");
    EXPECT_TRUE(result.warnings.empty());
}

TEST(EngineTest, PaginateJsonEchoesSnapshot) {
    const std::string json = R"({"type": "doc", "content": [
        {"type": "paragraph", "attrs": {"level": 2, "spacing": {"before": 10}, "rsid": null},
         "content": [{"type": "text", "text": "ab", "marks": [{"type": "bold"}]}]}
    ]})";
    Json::CharReaderBuilder builder;
    Json::Value input;
    std::string errors;
    std::istringstream stream(json);
    ASSERT_TRUE(Json::parseFromStream(builder, stream, &input, &errors));

    auto surface = std::make_shared<MockGeometryProvider>();
    surface->layoutDocument(parseDocumentJson(json));
    Engine engine(surface);
    auto result = engine.paginateJson(json);
    ASSERT_EQ(result.pages.size(), 1u);
    EXPECT_EQ(result.document, input);

    // Same snapshot when nothing is rendered
    auto hidden = std::make_shared<MockGeometryProvider>();
    hidden->renderSurface = false;
    Engine hiddenEngine(hidden);
    auto degraded = hiddenEngine.paginateJson(json);
    EXPECT_TRUE(degraded.pages.empty());
    EXPECT_EQ(degraded.document, input);
}

TEST(EngineTest, PaginateJsonRejectsMalformedInput) {
    auto surface = std::make_shared<MockGeometryProvider>();
    Engine engine(surface);

    auto result = engine.paginateJson("{\"type\":");
    EXPECT_TRUE(result.pages.empty());
    EXPECT_TRUE(hasWarning(result, PaginationWarning::ParseError));
}

TEST(EngineTest, RepaginateWithNewPageSize) {
    auto doc = makeDocument({DocNode::paragraph(std::string(400, 'x'))});
    auto surface = std::make_shared<MockGeometryProvider>();
    surface->layoutDocument(*doc);
    Engine engine(surface);

    auto tall = engine.paginate(doc);
    EXPECT_EQ(tall.pages.size(), 1u);

    auto shortPages = engine.repaginate(pageOfHeight(300));
    EXPECT_EQ(shortPages.pages.size(), 2u);

    // The last params are kept
    auto again = engine.repaginate();
    EXPECT_EQ(toJsonString(again), toJsonString(shortPages));
    EXPECT_EQ(engine.geometry(), surface);
}
