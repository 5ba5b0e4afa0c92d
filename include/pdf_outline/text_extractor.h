#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "pdf_outline/types.h"

namespace pdf_outline {

struct ExtractOptions {
    int page_limit = -1;         // negative extracts every page
    size_t thread_count = 1;     // > 1 decodes pages on a ThreadPool
    bool verbose = false;
    // Asked before each page; returning false stops extraction there
    std::function<bool(int page)> should_continue;
};

// Reads styled text spans out of a PDF with MuPDF's structured text device.
// An instance owns one fz_context and must stay on one thread.
class TextExtractor {
public:
    explicit TextExtractor(bool verbose = false);
    ~TextExtractor();

    // Throws MalformedDocumentError when the file cannot be opened and
    // UnsupportedDocumentError when it is password protected. A page that
    // fails to decode comes back with its error field set.
    PageSpans extract_page(const std::string& pdf_path, int page_number);

    std::vector<PageSpans> extract_all_pages(const std::string& pdf_path,
                                             const ExtractOptions& options = ExtractOptions{});

    int get_page_count(const std::string& pdf_path);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace pdf_outline
