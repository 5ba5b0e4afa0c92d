#include <gtest/gtest.h>
#include <pdf_outline/errors.h>
#include <pdf_outline/json_serializer.h>
#include <filesystem>
#include <fstream>

using namespace pdf_outline;

class JsonSerializerTest : public ::testing::Test {
protected:
    Outline CreateOutline() {
        Outline outline;
        outline.title = "Annual Report";
        outline.headings.push_back({HeadingLevel::H1, "1. Überblick", 0, 120.0f, 18.0f, 3});
        outline.headings.push_back({HeadingLevel::H2, "1.1 \"Quoted\" Scope", 1, 80.0f, 14.0f, 7});
        outline.headings.push_back({HeadingLevel::H3, "付録", 4, 300.0f, 12.0f, 20});
        return outline;
    }

    nlohmann::json CreateDump() {
        return nlohmann::json::parse(R"({
            "pages": [
                {"page": 0, "width": 612, "height": 792, "spans": [
                    {"text": "Annual Report", "size": 24, "font": "Helvetica-Bold", "bold": true,
                     "bbox": [200, 72, 412, 100]},
                    {"text": "Body", "size": 10, "bbox": [72, 120, 100, 132]}
                ]},
                {"page": 1, "error": "broken content stream"}
            ]
        })");
    }
};

TEST_F(JsonSerializerTest, SerializeOutline) {
    auto result = nlohmann::json::parse(JsonSerializer::serialize_outline(CreateOutline()));

    EXPECT_EQ(result["title"], "Annual Report");
    ASSERT_EQ(result["outline"].size(), 3u);
    EXPECT_EQ(result["outline"][0]["level"], "H1");
    EXPECT_EQ(result["outline"][0]["text"], "1. Überblick");
    EXPECT_EQ(result["outline"][0]["page"], 0);
    EXPECT_EQ(result["outline"][1]["text"], "1.1 \"Quoted\" Scope");
    EXPECT_EQ(result["outline"][2]["level"], "H3");
    EXPECT_EQ(result["outline"][2]["page"], 4);

    // Only the three public keys per entry
    EXPECT_EQ(result["outline"][0].size(), 3u);
    EXPECT_FALSE(result.contains("warnings"));
}

TEST_F(JsonSerializerTest, EmptyOutline) {
    Outline outline;
    EXPECT_EQ(JsonSerializer::serialize_outline(outline), R"({"title":"","outline":[]})");
}

TEST_F(JsonSerializerTest, SerializationIsDeterministic) {
    Outline outline = CreateOutline();
    EXPECT_EQ(JsonSerializer::serialize_outline(outline), JsonSerializer::serialize_outline(outline));

    std::string pretty = JsonSerializer::serialize_outline(outline, true);
    EXPECT_NE(pretty.find('\n'), std::string::npos);
    EXPECT_EQ(nlohmann::json::parse(pretty),
              nlohmann::json::parse(JsonSerializer::serialize_outline(outline)));
}

TEST_F(JsonSerializerTest, DiagnosticsAreOptIn) {
    Outline outline = CreateOutline();
    outline.partial = true;
    outline.diagnostics.push_back({DiagnosticKind::ResourceExceeded, -1, "page limit reached"});
    outline.diagnostics.push_back({DiagnosticKind::MalformedDocument, 3, "page skipped"});
    outline.stats.pages_processed = 5;

    auto result = nlohmann::json::parse(JsonSerializer::serialize_outline(outline, false, true));
    EXPECT_EQ(result["partial"], true);
    ASSERT_EQ(result["warnings"].size(), 2u);
    EXPECT_EQ(result["warnings"][0]["kind"], "resource_exceeded");
    EXPECT_EQ(result["warnings"][0]["page"], -1);
    EXPECT_EQ(result["warnings"][1]["kind"], "malformed_document");
    EXPECT_EQ(result["warnings"][1]["message"], "page skipped");
    EXPECT_EQ(result["stats"]["pages_processed"], 5);
}

TEST_F(JsonSerializerTest, ParsePages) {
    auto pages = JsonSerializer::parse_pages(CreateDump());

    ASSERT_EQ(pages.size(), 2u);
    EXPECT_EQ(pages[0].page, 0);
    EXPECT_FLOAT_EQ(pages[0].width, 612.0f);
    ASSERT_EQ(pages[0].spans.size(), 2u);
    EXPECT_EQ(pages[0].spans[0].text, "Annual Report");
    EXPECT_FLOAT_EQ(pages[0].spans[0].font_size, 24.0f);
    EXPECT_TRUE(pages[0].spans[0].bold);
    EXPECT_FLOAT_EQ(pages[0].spans[0].bbox.x1, 412.0f);
    EXPECT_EQ(pages[0].spans[1].font_name, "");
    EXPECT_FALSE(pages[0].spans[1].bold);
    EXPECT_EQ(pages[0].spans[1].page, 0);

    EXPECT_EQ(pages[1].error, "broken content stream");
    EXPECT_TRUE(pages[1].spans.empty());
}

TEST_F(JsonSerializerTest, ParsePagesRejectsBadInput) {
    EXPECT_THROW(JsonSerializer::parse_pages(nlohmann::json::array()), MalformedDocumentError);
    EXPECT_THROW(JsonSerializer::parse_pages(nlohmann::json::parse(R"({"pages": 3})")),
                 MalformedDocumentError);

    // Span without a size
    EXPECT_THROW(JsonSerializer::parse_pages(nlohmann::json::parse(
                     R"({"pages": [{"spans": [{"text": "x", "bbox": [0, 0, 1, 1]}]}]})")),
                 MalformedDocumentError);

    // Two-element bbox
    try {
        JsonSerializer::parse_pages(nlohmann::json::parse(
            R"({"pages": [{"page": 2, "spans": [{"text": "x", "size": 9, "bbox": [0, 0]}]}]})"));
        FAIL() << "expected MalformedDocumentError";
    } catch (const MalformedDocumentError& e) {
        EXPECT_EQ(e.page(), 2);
    }
}

TEST_F(JsonSerializerTest, PagesToJsonReadsBack) {
    auto pages = JsonSerializer::parse_pages(CreateDump());
    auto dump = JsonSerializer::pages_to_json(pages);

    EXPECT_EQ(dump["pages"][0]["spans"][0]["font"], "Helvetica-Bold");
    EXPECT_EQ(dump["pages"][0]["spans"][0]["bbox"].size(), 4u);
    EXPECT_FALSE(dump["pages"][0].contains("error"));
    EXPECT_EQ(dump["pages"][1]["error"], "broken content stream");

    auto again = JsonSerializer::parse_pages(dump);
    ASSERT_EQ(again.size(), pages.size());
    EXPECT_EQ(again[0].spans[0].text, pages[0].spans[0].text);
}

TEST_F(JsonSerializerTest, LoadPages) {
    auto path = std::filesystem::temp_directory_path() / "pdf_outline_spans_test.json";
    {
        std::ofstream file(path);
        file << CreateDump().dump();
    }
    auto pages = JsonSerializer::load_pages(path.string());
    EXPECT_EQ(pages.size(), 2u);
    std::filesystem::remove(path);

    EXPECT_THROW(JsonSerializer::load_pages("non_existent_spans.json"), MalformedDocumentError);
}
