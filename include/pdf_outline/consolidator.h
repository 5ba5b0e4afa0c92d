#pragma once

#include <vector>
#include "pdf_outline/types.h"

namespace pdf_outline {

struct ConsolidatorOptions {
    float line_center_tolerance = 0.5f;  // x font size, max baseline drift inside a line
    float size_tolerance = 0.5f;         // points
    float span_space_factor = 0.15f;     // gaps wider than this x size get a space
    float max_span_gap_factor = 1.5f;    // wider gaps split a row (columns)
    float block_gap_factor = 0.8f;       // x line height, max gap between lines of a block
    float align_tolerance = 3.0f;        // points, same left edge / same center
    float center_tolerance_ratio = 0.06f;// of text area width
    float max_centered_width = 0.85f;    // wider blocks are paragraphs, not centered lines
};

// Groups the spans of one page into lines and blocks (see Block for the
// derived attributes). Blank spans are ignored and empty blocks dropped.
std::vector<Block> consolidate_page(const PageSpans& page,
                                    const ConsolidatorOptions& options = ConsolidatorOptions{});

std::vector<Line> build_lines(const std::vector<Span>& spans,
                              const ConsolidatorOptions& options = ConsolidatorOptions{});

} // namespace pdf_outline
