#include <gtest/gtest.h>
#include <pdf_outline/json_serializer.h>
#include <pdf_outline/outline_extractor.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include "test_helpers.h"

using namespace pdf_outline;
using test_helpers::PageBuilder;

namespace {

struct Section {
    std::string heading;
    float size;
};

// Each section is a bold heading followed by two body paragraphs
PageSpans section_page(int page, const std::vector<Section>& sections) {
    PageBuilder builder(page);
    float y = 72.0f;
    for (const auto& section : sections) {
        y = builder.line(section.heading, section.size, y, true);
        y += 24.0f;
        y = builder.paragraph(section.heading + " body", 10.0f, y);
        y = builder.paragraph(section.heading + " more", 10.0f, y);
        y += 12.0f;
    }
    return builder.build();
}

bool has_diagnostic(const Outline& outline, DiagnosticKind kind) {
    return std::any_of(outline.diagnostics.begin(), outline.diagnostics.end(),
                       [kind](const Diagnostic& d) { return d.kind == kind; });
}

} // namespace

class OutlineExtractorTest : public ::testing::Test {
protected:
    OutlineExtractor extractor_;
};

TEST_F(OutlineExtractorTest, SinglePageTitleWithoutHeadings) {
    PageBuilder builder(0);
    builder.centered("Annual Report", 24.0f, 72.0f, true);
    float y = builder.paragraph("The year in review", 11.0f, 130.0f);
    y = builder.paragraph("Revenue grew", 11.0f, y);
    builder.paragraph("Outlook remains", 11.0f, y);

    Outline outline = extractor_.extract_pages({builder.build()});
    EXPECT_EQ(outline.title, "Annual Report");
    EXPECT_TRUE(outline.headings.empty());
    EXPECT_FALSE(outline.partial);
    EXPECT_EQ(JsonSerializer::serialize_outline(outline), R"({"title":"Annual Report","outline":[]})");
}

TEST_F(OutlineExtractorTest, ChapterPerPage) {
    Outline outline = extractor_.extract_pages(test_helpers::chapter_document());

    EXPECT_EQ(outline.title, "Chapter 1");
    ASSERT_EQ(outline.headings.size(), 3u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(outline.headings[i].level, HeadingLevel::H1);
        EXPECT_EQ(outline.headings[i].text, "Chapter " + std::to_string(i + 1));
        EXPECT_EQ(outline.headings[i].page, i);
    }
    EXPECT_EQ(outline.stats.pages_processed, 3);
    EXPECT_EQ(outline.stats.blocks_seen, 12);
    EXPECT_EQ(outline.stats.candidates_kept, 3);
}

TEST_F(OutlineExtractorTest, InputOrderDoesNotMatter) {
    auto pages = test_helpers::chapter_document();
    auto shuffled = pages;
    std::reverse(shuffled.begin(), shuffled.end());
    for (auto& page : shuffled) {
        std::reverse(page.spans.begin(), page.spans.end());
    }

    EXPECT_EQ(JsonSerializer::serialize_outline(extractor_.extract_pages(pages)),
              JsonSerializer::serialize_outline(extractor_.extract_pages(shuffled)));
}

TEST_F(OutlineExtractorTest, RepeatedRunsGiveIdenticalJson) {
    auto pages = test_helpers::chapter_document();
    std::string first = JsonSerializer::serialize_outline(extractor_.extract_pages(pages), true);
    std::string second = JsonSerializer::serialize_outline(extractor_.extract_pages(pages), true);
    EXPECT_EQ(first, second);
}

TEST_F(OutlineExtractorTest, SizeTiersBecomeLevels) {
    std::vector<PageSpans> pages = {
        section_page(0, {{"Methods", 18.0f}, {"Sampling", 14.0f}}),
        section_page(1, {{"Results", 18.0f}, {"Accuracy", 14.0f}}),
        section_page(2, {{"Discussion", 18.0f}})};

    Outline outline = extractor_.extract_pages(pages);
    EXPECT_EQ(outline.title, "Methods");
    ASSERT_EQ(outline.headings.size(), 5u);
    EXPECT_EQ(outline.headings[0].text, "Methods");
    EXPECT_EQ(outline.headings[0].level, HeadingLevel::H1);
    EXPECT_EQ(outline.headings[1].text, "Sampling");
    EXPECT_EQ(outline.headings[1].level, HeadingLevel::H2);
    EXPECT_EQ(outline.headings[3].level, HeadingLevel::H2);
    EXPECT_EQ(outline.headings[4].text, "Discussion");
    for (const auto& heading : outline.headings) {
        EXPECT_NE(heading.level, HeadingLevel::H3) << heading.text;
    }
}

TEST_F(OutlineExtractorTest, SectionNumbersAdjustLevels) {
    std::vector<PageSpans> pages = {
        section_page(0, {{"1. Introduction", 18.0f}}),
        section_page(1, {{"2. Results", 14.0f}, {"2.1 Subsection", 14.0f}}),
        section_page(2, {{"3. Discussion", 18.0f}})};

    Outline outline = extractor_.extract_pages(pages);
    ASSERT_EQ(outline.headings.size(), 4u);
    EXPECT_EQ(outline.headings[0].text, "1. Introduction");
    EXPECT_EQ(outline.headings[0].level, HeadingLevel::H1);
    EXPECT_EQ(outline.headings[1].text, "2. Results");
    EXPECT_EQ(outline.headings[1].level, HeadingLevel::H1);
    EXPECT_EQ(outline.headings[2].text, "2.1 Subsection");
    EXPECT_EQ(outline.headings[2].level, HeadingLevel::H2);
    EXPECT_EQ(outline.headings[3].level, HeadingLevel::H1);
    EXPECT_EQ(outline.title, "1. Introduction");
}

TEST_F(OutlineExtractorTest, OnePageOfEqualSections) {
    std::vector<std::string> sections = {"1. Introduction", "2. Methods", "3. Results"};
    Outline outline = extractor_.extract_pages(
        {section_page(0, {{sections[0], 14.0f}, {sections[1], 14.0f}, {sections[2], 14.0f}})});

    ASSERT_NE(std::find(sections.begin(), sections.end(), outline.title), sections.end());
    ASSERT_EQ(outline.headings.size(), 2u);
    for (const auto& heading : outline.headings) {
        EXPECT_NE(heading.text, outline.title);
        EXPECT_EQ(heading.level, HeadingLevel::H1);
        EXPECT_EQ(heading.page, 0);
    }
}

TEST_F(OutlineExtractorTest, LargePageNumbersAreNotHeadings) {
    auto pages = test_helpers::chapter_document();
    for (auto& page : pages) {
        std::string number = page.page == 1 ? "- 2 -" : "Page " + std::to_string(page.page + 1) + " of 3";
        float x0 = (test_helpers::kPageWidth - test_helpers::text_width(number, 16.0f)) * 0.5f;
        page.spans.push_back(test_helpers::make_span(number, 16.0f, x0, 740.0f, true, page.page));
    }

    Outline outline = extractor_.extract_pages(pages);
    ASSERT_EQ(outline.headings.size(), 3u);
    for (const auto& heading : outline.headings) {
        EXPECT_EQ(heading.text.rfind("Chapter", 0), 0u) << heading.text;
    }
}

TEST_F(OutlineExtractorTest, RunningHeadersAreNotHeadings) {
    auto pages = test_helpers::chapter_document();
    for (auto& page : pages) {
        page.spans.push_back(test_helpers::make_span("ACME Quarterly", 14.0f,
                                                     test_helpers::kMargin, 30.0f, true, page.page));
    }

    Outline outline = extractor_.extract_pages(pages);
    ASSERT_EQ(outline.headings.size(), 3u);
    EXPECT_EQ(outline.headings[0].text, "Chapter 1");
}

TEST_F(OutlineExtractorTest, NonLatinHeadings) {
    std::vector<PageSpans> pages = {
        section_page(0, {{"Введение", 18.0f}}),
        section_page(1, {{"Заключение", 18.0f}})};

    Outline outline = extractor_.extract_pages(pages);
    ASSERT_EQ(outline.headings.size(), 2u);
    EXPECT_EQ(outline.headings[0].text, "Введение");
    EXPECT_EQ(outline.headings[1].text, "Заключение");
    EXPECT_EQ(outline.title, "Введение");
}

TEST_F(OutlineExtractorTest, PageLimitMarksPartial) {
    OutlineOptions options;
    options.page_limit = 2;
    OutlineExtractor extractor(options);

    Outline outline = extractor.extract_pages(test_helpers::chapter_document());
    EXPECT_TRUE(outline.partial);
    EXPECT_TRUE(has_diagnostic(outline, DiagnosticKind::ResourceExceeded));
    ASSERT_EQ(outline.headings.size(), 2u);
    for (const auto& heading : outline.headings) {
        EXPECT_LT(heading.page, 2);
    }
    EXPECT_EQ(outline.stats.pages_processed, 2);
}

TEST_F(OutlineExtractorTest, ExhaustedTimeBudgetGivesEmptyPartialOutline) {
    OutlineOptions options;
    options.time_limit = std::chrono::milliseconds(0);
    OutlineExtractor extractor(options);

    Outline outline = extractor.extract_pages(test_helpers::chapter_document());
    EXPECT_TRUE(outline.partial);
    EXPECT_TRUE(has_diagnostic(outline, DiagnosticKind::ResourceExceeded));
    EXPECT_EQ(outline.title, "");
    EXPECT_TRUE(outline.headings.empty());
}

TEST_F(OutlineExtractorTest, MemoryLimitStopsAfterFirstPage) {
    OutlineOptions options;
    options.memory_limit_mb = 0;
    OutlineExtractor extractor(options);

    Outline outline = extractor.extract_pages(test_helpers::chapter_document());
    EXPECT_TRUE(outline.partial);
    EXPECT_EQ(outline.stats.pages_processed, 1);
    // Alone on its page, the first chapter heading becomes the title
    EXPECT_EQ(outline.title, "Chapter 1");
    EXPECT_TRUE(outline.headings.empty());
}

TEST_F(OutlineExtractorTest, MalformedPageIsSkipped) {
    auto pages = test_helpers::chapter_document();
    pages[1].spans.clear();
    pages[1].error = "broken content stream";

    Outline outline = extractor_.extract_pages(pages);
    ASSERT_EQ(outline.headings.size(), 2u);
    EXPECT_EQ(outline.headings[0].page, 0);
    EXPECT_EQ(outline.headings[1].page, 2);

    auto malformed = std::find_if(outline.diagnostics.begin(), outline.diagnostics.end(),
                                  [](const Diagnostic& d) { return d.kind == DiagnosticKind::MalformedDocument; });
    ASSERT_NE(malformed, outline.diagnostics.end());
    EXPECT_EQ(malformed->page, 1);
}

TEST_F(OutlineExtractorTest, EmptyInput) {
    Outline outline = extractor_.extract_pages({});
    EXPECT_EQ(outline.title, "");
    EXPECT_TRUE(outline.headings.empty());
    EXPECT_TRUE(outline.diagnostics.empty());

    PageSpans blank;
    blank.page = 0;
    outline = extractor_.extract_pages({blank});
    EXPECT_TRUE(outline.headings.empty());
    EXPECT_TRUE(has_diagnostic(outline, DiagnosticKind::UnsupportedDocument));
}

TEST_F(OutlineExtractorTest, MissingPdfBecomesDiagnostic) {
    Outline outline;
    ASSERT_NO_THROW(outline = extractor_.extract("non_existent.pdf"));
    EXPECT_TRUE(outline.headings.empty());
    EXPECT_TRUE(has_diagnostic(outline, DiagnosticKind::MalformedDocument));
}

TEST_F(OutlineExtractorTest, UnreadablePdfBecomesDiagnostic) {
    auto path = std::filesystem::temp_directory_path() / "pdf_outline_unreadable.pdf";
    {
        std::ofstream out(path, std::ios::binary);
        out << "this is not a PDF file at all";
    }

    Outline outline;
    ASSERT_NO_THROW(outline = extractor_.extract(path.string()));
    EXPECT_TRUE(outline.headings.empty());
    EXPECT_EQ(outline.title, "");
    std::filesystem::remove(path);
}

TEST(DiagnosticKindTest, DocumentFailuresMapToKinds) {
    EXPECT_EQ(diagnostic_kind(MalformedDocumentError("bad xref", 3)), DiagnosticKind::MalformedDocument);
    EXPECT_EQ(diagnostic_kind(UnsupportedDocumentError("encrypted")), DiagnosticKind::UnsupportedDocument);
    EXPECT_EQ(diagnostic_kind(ResourceExceededError("no context")), DiagnosticKind::ResourceExceeded);
    EXPECT_EQ(diagnostic_kind(OutlineError("unknown")), DiagnosticKind::MalformedDocument);
}

TEST_F(OutlineExtractorTest, Stats) {
    extractor_.extract_pages(test_helpers::chapter_document());
    extractor_.extract_pages(test_helpers::chapter_document());

    auto stats = extractor_.get_stats();
    EXPECT_EQ(stats["documents_processed"], 2);
    EXPECT_EQ(stats["pages_processed"], 6);
    EXPECT_EQ(stats["headings_emitted"], 6);
    EXPECT_TRUE(stats.contains("average_processing_time_ms"));
}

TEST_F(OutlineExtractorTest, DefaultOptions) {
    EXPECT_EQ(extractor_.options().page_limit, 50);
    EXPECT_EQ(extractor_.options().memory_limit_mb, 200u);
    EXPECT_EQ(extractor_.options().time_limit.count(), 10000);
}
