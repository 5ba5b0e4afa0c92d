#include "pdf_outline/outline_assembler.h"
#include "pdf_outline/text_utils.h"
#include <algorithm>

namespace pdf_outline {

const char* to_string(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::MalformedDocument: return "malformed_document";
        case DiagnosticKind::UnsupportedDocument: return "unsupported_document";
        case DiagnosticKind::ResourceExceeded: return "resource_exceeded";
    }
    return "unknown";
}

Outline assemble_outline(Classification classification, const AssemblerOptions& options) {
    Outline outline;
    outline.headings = std::move(classification.headings);

    std::stable_sort(outline.headings.begin(), outline.headings.end(),
                     [](const Heading& a, const Heading& b) {
                         if (a.page != b.page) {
                             return a.page < b.page;
                         }
                         if (a.y != b.y) {
                             return a.y < b.y;
                         }
                         return a.order < b.order;
                     });

    std::string title;
    if (classification.title) {
        title = classification.title->block.text;
    } else if (options.fallback_to_first_h1) {
        auto first_h1 = std::find_if(outline.headings.begin(), outline.headings.end(),
                                     [](const Heading& h) { return h.level == HeadingLevel::H1; });
        if (first_h1 != outline.headings.end()) {
            title = first_h1->text;
        }
    }
    outline.title = truncate_text(title, options.max_title_chars);
    return outline;
}

} // namespace pdf_outline
