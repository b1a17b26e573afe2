#include <gtest/gtest.h>
#include "pageflow/line_break.h"
#include "mock_surface.h"
#include <limits>
#include <string>

using namespace pageflow;

// MARK: - Line grouping

TEST(LineGroupingTest, MergesRectsWithinTolerance) {
    std::vector<Rect> rects = {
        Rect::fromEdges(20, 40, 50, 100),
        Rect::fromEdges(0, 20, 0, 50),
        Rect::fromEdges(21, 41, 0, 40),
    };

    auto lines = groupLineRects(rects);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_FLOAT_EQ(lines[0].top, 0);
    EXPECT_FLOAT_EQ(lines[0].bottom, 20);
    EXPECT_FLOAT_EQ(lines[1].top, 20);
    EXPECT_FLOAT_EQ(lines[1].bottom, 41);
    EXPECT_FLOAT_EQ(lines[1].left, 0);
    EXPECT_FLOAT_EQ(lines[1].right, 100);
    EXPECT_FLOAT_EQ(lines[1].width, 100);
}

TEST(LineGroupingTest, NormalizeRejectsEmptyRects) {
    EXPECT_FALSE(normalizeLineRect(Rect::fromEdges(0, 20, 10, 10)).has_value());
    EXPECT_FALSE(normalizeLineRect(Rect::fromEdges(20, 20, 0, 10)).has_value());

    Rect broken = Rect::fromEdges(0, 20, 0, 10);
    broken.top = std::numeric_limits<float>::quiet_NaN();
    EXPECT_FALSE(normalizeLineRect(broken).has_value());

    EXPECT_TRUE(normalizeLineRect(Rect::fromEdges(0, 20, 0, 10)).has_value());
}

TEST(LineGroupingTest, SamplePointsStayInsideLine) {
    Rect line = Rect::fromEdges(100, 120, 0, 100);

    auto points = resolveSamplePoints(line);
    ASSERT_EQ(points.size(), 6u);
    EXPECT_FLOAT_EQ(points[0].left, 1);
    EXPECT_FLOAT_EQ(points[0].top, 101);
    for (const auto& point : points) {
        EXPECT_GE(point.left, line.left);
        EXPECT_LE(point.left, line.right);
        EXPECT_GT(point.top, line.top);
        EXPECT_LT(point.top, line.bottom);
    }
}

TEST(LineGroupingTest, NarrowLinesUseFewerSamples) {
    EXPECT_EQ(resolveSamplePoints(Rect::fromEdges(0, 20, 0, 4)).size(), 5u);
    EXPECT_EQ(resolveSamplePoints(Rect::fromEdges(0, 20, 0, 2)).size(), 3u);
}

// MARK: - Break search

TEST(LineBreakSearchTest, BreaksAtStartOfOverflowingLine) {
    // 400 characters wrap into 10 lines of 20px
    Document doc(DocNode::block("doc", {DocNode::paragraph(std::string(400, 'x'))}));
    MockGeometryProvider surface;
    surface.layoutDocument(doc);
    MeasurementView view(doc, surface);

    auto result = findLineBreakInBlock(view, 0, doc.root().child(0), 110);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->pos, 201);
    EXPECT_FLOAT_EQ(result->top, 100);
    EXPECT_FLOAT_EQ(result->bottom, 120);
}

TEST(LineBreakSearchTest, NoBreakWhenBlockFits) {
    Document doc(DocNode::block("doc", {DocNode::paragraph(std::string(400, 'x'))}));
    MockGeometryProvider surface;
    surface.layoutDocument(doc);
    MeasurementView view(doc, surface);

    EXPECT_FALSE(findLineBreakInBlock(view, 0, doc.root().child(0), 300).has_value());
    // Within the grouping tolerance of the last line
    EXPECT_FALSE(findLineBreakInBlock(view, 0, doc.root().child(0), 198).has_value());
}

TEST(LineBreakSearchTest, MidWordProbeRewindsToWordStart) {
    Document doc(DocNode::block("doc", {DocNode::paragraph("hello world")}));
    MockGeometryProvider surface;
    surface.layoutDocument(doc);
    surface.forcedPointPos = 10;  // Between "wor" and "ld"
    MeasurementView view(doc, surface);

    auto result = findLineBreakInBlock(view, 0, doc.root().child(0), 10);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->pos, 7);
    EXPECT_FLOAT_EQ(result->top, 0);
}

TEST(LineBreakSearchTest, WordStartCountsUtf16Units) {
    // "héllo wörld": 11 positions, "ld" starts at 10
    Document doc(DocNode::block("doc", {DocNode::paragraph("h\xC3\xA9llo w\xC3\xB6rld")}));
    MockGeometryProvider surface;
    surface.layoutDocument(doc);
    surface.forcedPointPos = 10;
    MeasurementView view(doc, surface);

    auto result = findLineBreakInBlock(view, 0, doc.root().child(0), 10);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->pos, 7);
    EXPECT_EQ(doc.root().child(0).nodeSize(), 13);
}

TEST(LineBreakSearchTest, MinimumPositionIsRespected) {
    Document doc(DocNode::block("doc", {DocNode::paragraph(std::string(400, 'x'))}));
    MockGeometryProvider surface;
    surface.layoutDocument(doc);
    MeasurementView view(doc, surface);

    auto result = findLineBreakInBlock(view, 0, doc.root().child(0), 110, 300);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->pos, 300);
    EXPECT_FLOAT_EQ(result->top, 140);
}

TEST(LineBreakSearchTest, PositionClampedInsideBlock) {
    Document doc(DocNode::block("doc", {DocNode::paragraph("ab"), DocNode::paragraph(std::string(80, 'y'))}));
    MockGeometryProvider surface;
    surface.layoutDocument(doc);
    surface.forcedPointPos = 500;
    MeasurementView view(doc, surface);

    // Second paragraph at 4 holds positions 5 to 85 on two lines
    auto result = findLineBreakInBlock(view, 4, doc.root().child(1), 30);
    ASSERT_TRUE(result.has_value());
    EXPECT_LE(result->pos, 85);
    EXPECT_GE(result->pos, 5);
}

TEST(LineBreakSearchTest, UnmeasuredBlockHasNoBreak) {
    Document doc(DocNode::block("doc", {DocNode::paragraph("ab")}));
    MockGeometryProvider surface;
    MeasurementView view(doc, surface);

    EXPECT_FALSE(findLineBreakInBlock(view, 0, doc.root().child(0), 10).has_value());
    EXPECT_FALSE(findLineBreakInBlock(view, 0, doc.root().child(0),
                                      std::numeric_limits<float>::infinity()).has_value());
}
