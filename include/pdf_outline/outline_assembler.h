#pragma once

#include <cstddef>
#include "pdf_outline/hierarchy_classifier.h"
#include "pdf_outline/types.h"

namespace pdf_outline {

struct AssemblerOptions {
    size_t max_title_chars = 100;        // code points, "..." appended when cut
    bool fallback_to_first_h1 = true;
};

// Sorts the headings by (page, y), keeping document order on ties, and fills
// the title. Without a detected title the first H1 stands in, or "".
Outline assemble_outline(Classification classification,
                         const AssemblerOptions& options = AssemblerOptions{});

} // namespace pdf_outline
