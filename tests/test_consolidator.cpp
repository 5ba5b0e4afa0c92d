#include <gtest/gtest.h>
#include <pdf_outline/consolidator.h>
#include "test_helpers.h"
#include <algorithm>

using namespace pdf_outline;
using test_helpers::make_span;
using test_helpers::PageBuilder;

class ConsolidatorTest : public ::testing::Test {
protected:
    PageSpans page_with(std::vector<Span> spans) {
        PageSpans page;
        page.page = 0;
        page.width = test_helpers::kPageWidth;
        page.height = test_helpers::kPageHeight;
        page.spans = std::move(spans);
        return page;
    }
};

TEST_F(ConsolidatorTest, EmptyPageYieldsNoBlocks) {
    EXPECT_TRUE(consolidate_page(page_with({})).empty());
    EXPECT_TRUE(consolidate_page(page_with({make_span("   ", 12.0f, 72.0f, 72.0f)})).empty());
}

TEST_F(ConsolidatorTest, SpansOnOneBaselineFormOneLine) {
    // "Annual" and "Report" with a word gap, then a bold run glued to it
    auto lines = build_lines({
        make_span("Report", 12.0f, 120.0f, 100.0f),
        make_span("Annual", 12.0f, 72.0f, 100.0f),
    });
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].text, "Annual Report");
    EXPECT_FLOAT_EQ(lines[0].font_size, 12.0f);
    EXPECT_FLOAT_EQ(lines[0].bbox.x0, 72.0f);
}

TEST_F(ConsolidatorTest, AdjacentSpansWithoutGapAreJoinedWithoutSpace) {
    auto lines = build_lines({
        make_span("Intro", 12.0f, 72.0f, 100.0f),
        make_span("duction", 12.0f, 72.0f + test_helpers::text_width("Intro", 12.0f), 100.0f),
    });
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].text, "Introduction");
}

TEST_F(ConsolidatorTest, DifferentSizesOnOneRowStaySeparate) {
    auto lines = build_lines({
        make_span("Heading", 18.0f, 72.0f, 100.0f),
        make_span("note", 9.0f, 150.0f, 104.0f),
    });
    EXPECT_EQ(lines.size(), 2u);
}

TEST_F(ConsolidatorTest, WrappedHeadingMergesIntoOneBlock) {
    auto blocks = consolidate_page(page_with({
        make_span("A Study of Heading Detection", 18.0f, 72.0f, 100.0f, true),
        make_span("in Multilingual Documents", 18.0f, 72.0f, 121.6f, true),
    }));
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].text, "A Study of Heading Detection in Multilingual Documents");
    EXPECT_EQ(blocks[0].line_count, 2);
    EXPECT_TRUE(blocks[0].bold);
}

TEST_F(ConsolidatorTest, FontChangeSplitsBlocks) {
    auto blocks = consolidate_page(page_with({
        make_span("Introduction", 16.0f, 72.0f, 100.0f, true),
        make_span("Body text follows right below the heading.", 11.0f, 72.0f, 120.0f),
    }));
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].text, "Introduction");
    EXPECT_EQ(blocks[1].text, "Body text follows right below the heading.");
}

TEST_F(ConsolidatorTest, FontFamilyChangeSplitsBlocks) {
    auto heading = make_span("Results of the Survey", 12.0f, 72.0f, 100.0f);
    heading.font_name = "Times-Roman";
    auto body = make_span("Responses were collected in two rounds.", 12.0f, 72.0f, 114.4f);
    body.font_name = "Helvetica";

    auto blocks = consolidate_page(page_with({heading, body}));
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].text, "Results of the Survey");
    EXPECT_EQ(blocks[0].font_name, "Times-Roman");
    EXPECT_EQ(blocks[1].text, "Responses were collected in two rounds.");
}

TEST_F(ConsolidatorTest, LargeVerticalGapSplitsBlocks) {
    auto blocks = consolidate_page(page_with({
        make_span("First paragraph line.", 11.0f, 72.0f, 100.0f),
        make_span("Second paragraph line.", 11.0f, 72.0f, 140.0f),
    }));
    EXPECT_EQ(blocks.size(), 2u);
}

TEST_F(ConsolidatorTest, BlocksComeInReadingOrderWithOrderIndex) {
    auto blocks = consolidate_page(page_with({
        make_span("Bottom", 11.0f, 72.0f, 700.0f),
        make_span("Top", 11.0f, 72.0f, 80.0f),
        make_span("Middle", 11.0f, 72.0f, 400.0f),
    }));
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0].text, "Top");
    EXPECT_EQ(blocks[1].text, "Middle");
    EXPECT_EQ(blocks[2].text, "Bottom");
    for (size_t i = 0; i < blocks.size(); ++i) {
        EXPECT_EQ(blocks[i].order, static_cast<int>(i));
    }
}

TEST_F(ConsolidatorTest, LayoutAttributes) {
    PageBuilder builder(0);
    builder.centered("Annual Report", 24.0f, 72.0f, true);
    float y = builder.paragraph("Overview", 11.0f, 140.0f);
    builder.line("  ", 11.0f, y);
    auto blocks = consolidate_page(builder.build());
    ASSERT_EQ(blocks.size(), 2u);

    const Block& title = blocks[0];
    EXPECT_TRUE(title.centered);
    EXPECT_GT(title.indent, 100.0f);
    EXPECT_FLOAT_EQ(title.space_above, 72.0f);
    EXPECT_NEAR(title.space_below, 140.0f - (72.0f + 24.0f * 1.2f), 0.01f);

    const Block& body = blocks[1];
    EXPECT_FALSE(body.centered);
    EXPECT_FLOAT_EQ(body.indent, 0.0f);
    EXPECT_EQ(body.line_count, 3);
    EXPECT_NEAR(body.space_below, test_helpers::kPageHeight - body.bbox.y1, 0.01f);
}

TEST_F(ConsolidatorTest, SizeSpreadAndDominantSize) {
    // Mostly 11pt with a short 14pt run on the same line
    auto blocks = consolidate_page(page_with({
        make_span("Regular sentence text with a", 11.0f, 72.0f, 100.0f),
        make_span("BIG", 11.4f, 72.0f + test_helpers::text_width("Regular sentence text with a ", 11.0f), 100.0f),
    }));
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_FLOAT_EQ(blocks[0].font_size, 11.0f);
    EXPECT_NEAR(blocks[0].size_spread, 0.4f, 0.001f);
}

TEST_F(ConsolidatorTest, CjkLinesJoinWithoutSpaces) {
    // 第一章 / 概要 wrapped over two lines
    auto blocks = consolidate_page(page_with({
        make_span("\xE7\xAC\xAC\xE4\xB8\x80\xE7\xAB\xA0", 16.0f, 72.0f, 100.0f, true),
        make_span("\xE6\xA6\x82\xE8\xA6\x81", 16.0f, 72.0f, 119.2f, true),
    }));
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].text, "\xE7\xAC\xAC\xE4\xB8\x80\xE7\xAB\xA0\xE6\xA6\x82\xE8\xA6\x81");
}

TEST_F(ConsolidatorTest, EverySpanLandsInExactlyOneBlock) {
    PageBuilder builder(0);
    float y = builder.line("Section Heading", 14.0f, 72.0f, true);
    y = builder.paragraph("Alpha", 10.0f, y + 10.0f);
    y = builder.line("Another Heading", 14.0f, y + 10.0f, true);
    builder.paragraph("Beta", 10.0f, y + 10.0f);
    auto blocks = consolidate_page(builder.build());

    size_t total_lines = 0;
    for (const auto& block : blocks) {
        total_lines += static_cast<size_t>(block.line_count);
    }
    EXPECT_EQ(total_lines, builder.build().spans.size());
    EXPECT_EQ(blocks.size(), 4u);
}
