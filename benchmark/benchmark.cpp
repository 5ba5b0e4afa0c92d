#include <benchmark/benchmark.h>
#include <pdf_outline/consolidator.h>
#include <pdf_outline/json_serializer.h>
#include <pdf_outline/outline_extractor.h>
#include <pdf_outline/text_extractor.h>
#include <filesystem>

namespace fs = std::filesystem;
using namespace pdf_outline;

// Create a test PDF path - you'll need to provide actual test PDFs
const std::string TEST_PDF_SMALL = "test_data/small.pdf";  // ~10 pages
const std::string TEST_PDF_LARGE = "test_data/large.pdf";  // 50+ pages

namespace {

Span make_span(const std::string& text, float size, float x0, float y0, bool bold, int page) {
    Span span;
    span.text = text;
    span.font_size = size;
    span.font_name = bold ? "Helvetica-Bold" : "Helvetica";
    span.bold = bold;
    span.bbox = {x0, y0, x0 + text.size() * size * 0.5f, y0 + size * 1.2f};
    span.page = page;
    return span;
}

// Chapter heading, three numbered sections and body text on every page
std::vector<PageSpans> generate_test_pages(int num_pages) {
    std::vector<PageSpans> pages;
    for (int p = 0; p < num_pages; ++p) {
        PageSpans page;
        page.page = p;
        page.width = 612.0f;
        page.height = 792.0f;

        float y = 72.0f;
        page.spans.push_back(make_span("Chapter " + std::to_string(p + 1), 20.0f, 72.0f, y, true, p));
        y += 48.0f;
        for (int s = 1; s <= 3; ++s) {
            std::string heading = std::to_string(p + 1) + "." + std::to_string(s) + " Section";
            page.spans.push_back(make_span(heading, 14.0f, 72.0f, y, true, p));
            y += 30.0f;
            for (int line = 0; line < 8; ++line) {
                // Two spans per line, as decoders emit at style changes
                std::string left = "Paragraph text of section " + std::to_string(s);
                std::string right = "continues across the line " + std::to_string(line);
                Span first = make_span(left, 10.0f, 72.0f, y, false, p);
                page.spans.push_back(first);
                page.spans.push_back(make_span(right, 10.0f, first.bbox.x1 + 2.5f, y, false, p));
                y += 12.0f;
            }
            y += 12.0f;
        }
        page.spans.push_back(make_span(std::to_string(p + 1), 10.0f, 300.0f, 750.0f, false, p));
        pages.push_back(std::move(page));
    }
    return pages;
}

} // namespace

static void BM_ConsolidatePage(benchmark::State& state) {
    auto pages = generate_test_pages(1);

    for (auto _ : state) {
        auto blocks = consolidate_page(pages[0]);
        benchmark::DoNotOptimize(blocks);
    }
    state.counters["spans"] = pages[0].spans.size();
}
BENCHMARK(BM_ConsolidatePage);

static void BM_OutlineFromSpans(benchmark::State& state) {
    OutlineOptions options;
    options.page_limit = static_cast<int>(state.range(0));
    OutlineExtractor extractor(options);
    auto pages = generate_test_pages(static_cast<int>(state.range(0)));

    for (auto _ : state) {
        auto outline = extractor.extract_pages(pages);
        benchmark::DoNotOptimize(outline);
    }

    auto stats = extractor.get_stats();
    state.counters["pages_per_second"] = stats.value("pages_per_second", 0.0);
}
BENCHMARK(BM_OutlineFromSpans)->Range(1, 512);

static void BM_SerializeOutline(benchmark::State& state) {
    OutlineOptions options;
    options.page_limit = 200;
    OutlineExtractor extractor(options);
    auto outline = extractor.extract_pages(generate_test_pages(200));

    for (auto _ : state) {
        auto json = JsonSerializer::serialize_outline(outline, false, true);
        benchmark::DoNotOptimize(json);
    }
    state.counters["headings"] = outline.headings.size();
}
BENCHMARK(BM_SerializeOutline);

static void BM_PdfExtraction(benchmark::State& state) {
    if (!fs::exists(TEST_PDF_SMALL)) {
        state.SkipWithError("Test PDF not found");
        return;
    }

    OutlineOptions options;
    options.thread_count = state.range(0);
    OutlineExtractor extractor(options);

    for (auto _ : state) {
        auto outline = extractor.extract(TEST_PDF_SMALL);
        benchmark::DoNotOptimize(outline);
    }

    auto stats = extractor.get_stats();
    state.counters["pages_per_second"] = stats.value("pages_per_second", 0.0);
}
BENCHMARK(BM_PdfExtraction)->Range(1, 8);

static void BM_SpanDecoding(benchmark::State& state) {
    if (!fs::exists(TEST_PDF_LARGE)) {
        state.SkipWithError("Test PDF not found");
        return;
    }

    TextExtractor extractor;
    ExtractOptions options;
    options.thread_count = state.range(0);
    options.page_limit = 50;

    for (auto _ : state) {
        auto pages = extractor.extract_all_pages(TEST_PDF_LARGE, options);
        benchmark::DoNotOptimize(pages);
    }
}
BENCHMARK(BM_SpanDecoding)->Range(1, 8)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
