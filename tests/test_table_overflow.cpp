#include <gtest/gtest.h>
#include "pageflow/table_overflow.h"
#include "mock_surface.h"
#include <limits>
#include <string>

using namespace pageflow;

namespace {

/// table 0 > row 1 > [cell 2 > p 3 (20 chars), cell 26 > p 27 (200 chars)]
/// Cells are 200px wide: the short one is one line, the tall one five.
Document tableDocument() {
    auto shortCell = DocNode::block("tableCell", {DocNode::paragraph(std::string(20, 'a'))});
    auto tallCell = DocNode::block("tableCell", {DocNode::paragraph(std::string(200, 'b'))});
    auto row = DocNode::block("tableRow", {shortCell, tallCell});
    return Document(DocNode::block("doc", {DocNode::block("table", {row})}));
}

} // namespace

// MARK: - Row overflow

TEST(TableOverflowTest, FindsCrossingRow) {
    Document doc = tableDocument();
    MockGeometryProvider surface;
    surface.layoutDocument(doc);
    MeasurementView view(doc, surface);

    auto overflow = findTableRowOverflow(view, 1, 50);
    ASSERT_TRUE(overflow.has_value());
    EXPECT_EQ(overflow->rowPos, 1);
    EXPECT_EQ(overflow->breakInfo.pos, 108);
    EXPECT_FLOAT_EQ(overflow->breakInfo.top, 40);
    EXPECT_FLOAT_EQ(overflow->breakInfo.bottom, 50);
    ASSERT_EQ(overflow->rowBreaks.size(), 1u);
    ASSERT_TRUE(overflow->rowBottom.has_value());
    EXPECT_FLOAT_EQ(*overflow->rowBottom, 100);
    EXPECT_FLOAT_EQ(overflow->boundary, 50);
}

TEST(TableOverflowTest, BreakNeverBelowBoundary) {
    Document doc = tableDocument();
    MockGeometryProvider surface;
    surface.layoutDocument(doc);
    MeasurementView view(doc, surface);

    for (float boundary : {25.0f, 50.0f, 75.0f}) {
        auto overflow = findTableRowOverflow(view, 1, boundary);
        ASSERT_TRUE(overflow.has_value());
        EXPECT_LE(overflow->breakInfo.bottom, boundary);
        EXPECT_LE(overflow->breakInfo.top, overflow->breakInfo.bottom);
        EXPECT_GT(overflow->breakInfo.pos, 1);
    }
}

TEST(TableOverflowTest, RowAboveBoundaryIsSkipped) {
    Document doc = tableDocument();
    MockGeometryProvider surface;
    surface.layoutDocument(doc);
    MeasurementView view(doc, surface);

    EXPECT_FALSE(findTableRowOverflow(view, 1, 100).has_value());
    EXPECT_FALSE(findTableRowOverflow(view, 1, std::numeric_limits<float>::infinity()).has_value());
}

TEST(TableOverflowTest, RowsBeforeStartAreSkipped) {
    Document doc = tableDocument();
    MockGeometryProvider surface;
    surface.layoutDocument(doc);
    MeasurementView view(doc, surface);

    EXPECT_FALSE(findTableRowOverflow(view, 231, 50).has_value());
}

TEST(TableOverflowTest, NoTableMeansNoOverflow) {
    Document doc(DocNode::block("doc", {DocNode::paragraph(std::string(400, 'x'))}));
    MockGeometryProvider surface;
    surface.layoutDocument(doc);
    MeasurementView view(doc, surface);

    EXPECT_FALSE(findTableRowOverflow(view, 0, 50).has_value());
}

// MARK: - Position search

TEST(TableOverflowTest, BinarySearchRewindsToLineStart) {
    Document doc(DocNode::block("doc", {DocNode::paragraph(std::string(200, 'x'))}));
    MockGeometryProvider surface;
    surface.layoutDocument(doc);
    MeasurementView view(doc, surface);

    // Third line holds positions 81 to 120
    auto found = binarySearchForYPosition(view, 1, 201, 40);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->pos, 81);
    ASSERT_TRUE(found->coords.has_value());
    EXPECT_FLOAT_EQ(found->coords->top, 40);
}

TEST(TableOverflowTest, BinarySearchRejectsBadInput) {
    Document doc(DocNode::block("doc", {DocNode::paragraph(std::string(200, 'x'))}));
    MockGeometryProvider surface;
    surface.layoutDocument(doc);
    MeasurementView view(doc, surface);

    EXPECT_FALSE(binarySearchForYPosition(view, 50, 10, 40).has_value());
    EXPECT_FALSE(binarySearchForYPosition(view, 1, 201, std::numeric_limits<float>::quiet_NaN()).has_value());
}

TEST(TableOverflowTest, BinarySearchWithoutCaretsFindsNothing) {
    Document doc(DocNode::block("doc", {DocNode::paragraph(std::string(200, 'x'))}));
    MockGeometryProvider surface;
    MeasurementView view(doc, surface);

    EXPECT_FALSE(binarySearchForYPosition(view, 1, 201, 40).has_value());
}

// MARK: - Spacing segments

TEST(SpacingSegmentsTest, OneMarkerPerCell) {
    Document doc = tableDocument();
    MockGeometryProvider surface;
    surface.layoutDocument(doc);
    MeasurementView view(doc, surface);

    // The short cell ends above the break line and keeps its end position
    auto segments = deriveSpacingSegments(view, 108, 40.0f);
    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[0], 25);
    EXPECT_EQ(segments[1], 108);
}

TEST(SpacingSegmentsTest, OutsideTableKeepsBase) {
    Document doc(DocNode::block("doc", {DocNode::paragraph(std::string(400, 'x'))}));
    MockGeometryProvider surface;
    surface.layoutDocument(doc);
    MeasurementView view(doc, surface);

    EXPECT_EQ(deriveSpacingSegments(view, 201, 100.0f), std::vector<int>({201}));
    EXPECT_EQ(deriveSpacingSegments(view, 5000, std::nullopt), std::vector<int>({402}));
}

TEST(SpacingSegmentsTest, NegativeBaseYieldsNothing) {
    Document doc = tableDocument();
    MockGeometryProvider surface;
    surface.layoutDocument(doc);
    MeasurementView view(doc, surface);

    EXPECT_TRUE(deriveSpacingSegments(view, -1, 40.0f).empty());
}
