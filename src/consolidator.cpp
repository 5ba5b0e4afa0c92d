#include "pdf_outline/consolidator.h"
#include "pdf_outline/text_utils.h"
#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>

namespace pdf_outline {

namespace {

struct WeightedStyle {
    float font_size = 0.0f;
    std::string font_name;
    bool bold = false;
    bool italic = false;
    float min_size = 0.0f;
    float max_size = 0.0f;
};

bool is_blank(const std::string& text) {
    for (char32_t cp : decode_utf8(text)) {
        if (!is_whitespace(cp)) {
            return false;
        }
    }
    return true;
}

// Character-weighted dominant style of a set of spans
WeightedStyle dominant_style(const std::vector<const Span*>& spans) {
    WeightedStyle style;
    if (spans.empty()) {
        return style;
    }

    std::map<float, size_t> size_weight;
    std::map<std::string, size_t> font_weight;
    size_t bold_chars = 0;
    size_t italic_chars = 0;
    size_t total = 0;
    style.min_size = spans.front()->font_size;
    style.max_size = spans.front()->font_size;

    for (const Span* span : spans) {
        size_t chars = std::max<size_t>(1, code_point_count(span->text));
        // Sizes are keyed at 0.1pt so rendering jitter does not split the vote
        float key = std::round(span->font_size * 10.0f) / 10.0f;
        size_weight[key] += chars;
        font_weight[span->font_name] += chars;
        if (span->bold) bold_chars += chars;
        if (span->italic) italic_chars += chars;
        total += chars;
        style.min_size = std::min(style.min_size, span->font_size);
        style.max_size = std::max(style.max_size, span->font_size);
    }

    // std::map iteration keeps ties deterministic: the smaller size / name wins
    size_t best = 0;
    for (const auto& [size, weight] : size_weight) {
        if (weight > best) {
            best = weight;
            style.font_size = size;
        }
    }
    best = 0;
    for (const auto& [name, weight] : font_weight) {
        if (weight > best) {
            best = weight;
            style.font_name = name;
        }
    }
    style.bold = bold_chars * 2 > total;
    style.italic = italic_chars * 2 > total;
    return style;
}

// Appends `next` to `text`, inserting a space unless either side already has
// one or both sides belong to a script written without spaces.
void append_with_separator(std::string& text, const std::string& next, bool gap_is_wide) {
    if (text.empty()) {
        text = next;
        return;
    }
    auto tail = decode_utf8(text.substr(text.size() > 4 ? text.size() - 4 : 0));
    auto head = decode_utf8(next.substr(0, 4));
    bool has_space = (!tail.empty() && is_whitespace(tail.back())) ||
                     (!head.empty() && is_whitespace(head.front()));
    bool unspaced = !tail.empty() && !head.empty() &&
                    is_unspaced(tail.back()) && is_unspaced(head.front());
    if (gap_is_wide && !has_space && !unspaced) {
        text += ' ';
    }
    text += next;
}

struct LineBuilder {
    std::vector<const Span*> spans;
    BBox bbox;
    float font_size = 0.0f;
    bool bold = false;

    float center_y() const { return bbox.center_y(); }
};

Line finish_line(LineBuilder& builder, const ConsolidatorOptions& options) {
    std::stable_sort(builder.spans.begin(), builder.spans.end(),
                     [](const Span* a, const Span* b) { return a->bbox.x0 < b->bbox.x0; });

    Line line;
    line.bbox = builder.bbox;
    const Span* previous = nullptr;
    for (const Span* span : builder.spans) {
        bool wide_gap = previous != nullptr &&
            span->bbox.x0 - previous->bbox.x1 > options.span_space_factor * span->font_size;
        append_with_separator(line.text, span->text, wide_gap);
        line.spans.push_back(*span);
        previous = span;
    }

    WeightedStyle style = dominant_style(builder.spans);
    line.font_size = style.font_size;
    line.font_name = style.font_name;
    line.bold = style.bold;
    line.italic = style.italic;
    return line;
}

struct BlockBuilder {
    std::vector<Line> lines;
    BBox bbox;
    float last_x0 = 0.0f;
};

bool same_font(const Line& a, const Line& b, float tolerance) {
    return std::fabs(a.font_size - b.font_size) <= tolerance &&
           a.bold == b.bold && a.italic == b.italic && a.font_name == b.font_name;
}

bool can_join_block(const BlockBuilder& block, const Line& line, const ConsolidatorOptions& options) {
    const Line& last = block.lines.back();
    if (!same_font(last, line, options.size_tolerance)) {
        return false;
    }

    float line_height = std::max(line.bbox.height(), line.font_size);
    float gap = line.bbox.y0 - block.bbox.y1;
    if (gap > options.block_gap_factor * line_height || gap < -0.5f * line_height) {
        return false;
    }

    // Must share the column
    if (line.bbox.x0 >= block.bbox.x1 || line.bbox.x1 <= block.bbox.x0) {
        return false;
    }

    bool same_left = std::fabs(line.bbox.x0 - block.last_x0) <= options.align_tolerance ||
                     std::fabs(line.bbox.x0 - block.bbox.x0) <= options.align_tolerance;
    bool same_center = std::fabs(line.bbox.center_x() - last.bbox.center_x()) <= options.align_tolerance;
    return same_left || same_center;
}

} // namespace

std::vector<Line> build_lines(const std::vector<Span>& spans, const ConsolidatorOptions& options) {
    std::vector<const Span*> ordered;
    ordered.reserve(spans.size());
    for (const auto& span : spans) {
        if (span.font_size > 0.0f && !is_blank(span.text)) {
            ordered.push_back(&span);
        }
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const Span* a, const Span* b) {
        if (a->bbox.center_y() != b->bbox.center_y()) {
            return a->bbox.center_y() < b->bbox.center_y();
        }
        return a->bbox.x0 < b->bbox.x0;
    });

    std::vector<LineBuilder> builders;
    for (const Span* span : ordered) {
        LineBuilder* target = nullptr;
        for (auto it = builders.rbegin(); it != builders.rend(); ++it) {
            float reference = std::max(it->font_size, span->font_size);
            float drift = std::fabs(it->center_y() - span->bbox.center_y());
            if (drift >= options.line_center_tolerance * reference) {
                // Builders are ordered by baseline; anything further up is out of reach
                if (it->center_y() < span->bbox.center_y() - reference) {
                    break;
                }
                continue;
            }
            if (std::fabs(it->font_size - span->font_size) > options.size_tolerance ||
                it->bold != span->bold) {
                continue;
            }
            float gap = span->bbox.x0 - it->bbox.x1;
            float overlap_limit = -0.5f * span->font_size;
            if (gap < overlap_limit || gap > options.max_span_gap_factor * span->font_size) {
                continue;
            }
            target = &*it;
            break;
        }

        if (target == nullptr) {
            LineBuilder builder;
            builder.bbox = span->bbox;
            builder.font_size = span->font_size;
            builder.bold = span->bold;
            builder.spans.push_back(span);
            builders.push_back(std::move(builder));
        } else {
            target->spans.push_back(span);
            target->bbox = target->bbox.united(span->bbox);
        }
    }

    std::vector<Line> lines;
    lines.reserve(builders.size());
    for (auto& builder : builders) {
        lines.push_back(finish_line(builder, options));
    }
    return lines;
}

std::vector<Block> consolidate_page(const PageSpans& page, const ConsolidatorOptions& options) {
    std::vector<Line> lines = build_lines(page.spans, options);
    if (lines.empty()) {
        return {};
    }

    std::stable_sort(lines.begin(), lines.end(), [](const Line& a, const Line& b) {
        if (a.bbox.y0 != b.bbox.y0) {
            return a.bbox.y0 < b.bbox.y0;
        }
        return a.bbox.x0 < b.bbox.x0;
    });

    std::vector<BlockBuilder> builders;
    for (auto& line : lines) {
        BlockBuilder* target = nullptr;
        for (auto it = builders.rbegin(); it != builders.rend(); ++it) {
            if (can_join_block(*it, line, options)) {
                target = &*it;
                break;
            }
            // Lines are sorted by top edge; blocks ending far above cannot join
            if (line.bbox.y0 - it->bbox.y1 > 4.0f * line.font_size) {
                break;
            }
        }
        if (target == nullptr) {
            BlockBuilder builder;
            builder.bbox = line.bbox;
            builder.last_x0 = line.bbox.x0;
            builder.lines.push_back(std::move(line));
            builders.push_back(std::move(builder));
        } else {
            target->bbox = target->bbox.united(line.bbox);
            target->last_x0 = line.bbox.x0;
            target->lines.push_back(std::move(line));
        }
    }

    // Text area used for indentation and centering
    float area_left = builders.front().bbox.x0;
    float area_right = builders.front().bbox.x1;
    for (const auto& builder : builders) {
        area_left = std::min(area_left, builder.bbox.x0);
        area_right = std::max(area_right, builder.bbox.x1);
    }
    float axis = page.width > 0.0f ? page.width * 0.5f : (area_left + area_right) * 0.5f;
    float area_width = page.width > 0.0f ? page.width : area_right - area_left;
    float center_tolerance = std::max(options.align_tolerance, options.center_tolerance_ratio * area_width);

    std::vector<Block> blocks;
    for (const auto& builder : builders) {
        std::string raw;
        std::vector<const Span*> spans;
        for (const auto& line : builder.lines) {
            append_with_separator(raw, line.text, true);
            for (const auto& span : line.spans) {
                spans.push_back(&span);
            }
        }

        Block block;
        block.text = normalize_text(raw);
        if (block.text.empty()) {
            continue;
        }
        WeightedStyle style = dominant_style(spans);
        block.font_size = style.font_size;
        block.font_name = style.font_name;
        block.bold = style.bold;
        block.italic = style.italic;
        block.size_spread = style.max_size - style.min_size;
        block.bbox = builder.bbox;
        block.page = page.page;
        block.line_count = static_cast<int>(builder.lines.size());
        block.char_count = static_cast<int>(code_point_count(block.text));
        block.indent = block.bbox.x0 - area_left;
        // Justified paragraphs sit on the axis too, but start at the margin
        block.centered = std::fabs(block.bbox.center_x() - axis) <= center_tolerance &&
                         block.bbox.width() <= options.max_centered_width * area_width &&
                         block.indent > options.align_tolerance;
        blocks.push_back(std::move(block));
    }

    std::stable_sort(blocks.begin(), blocks.end(), [](const Block& a, const Block& b) {
        if (a.bbox.y0 != b.bbox.y0) {
            return a.bbox.y0 < b.bbox.y0;
        }
        return a.bbox.x0 < b.bbox.x0;
    });

    // Vertical whitespace to the nearest block of the same column
    for (size_t i = 0; i < blocks.size(); ++i) {
        Block& block = blocks[i];
        float above = block.bbox.y0;
        float below = page.height > 0.0f ? page.height - block.bbox.y1 : 2.0f * block.font_size;
        for (size_t j = 0; j < blocks.size(); ++j) {
            if (j == i) continue;
            const Block& other = blocks[j];
            bool shares_column = other.bbox.x0 < block.bbox.x1 && other.bbox.x1 > block.bbox.x0;
            if (!shares_column) continue;
            if (other.bbox.y1 <= block.bbox.y0 + 0.5f) {
                above = std::min(above, block.bbox.y0 - other.bbox.y1);
            } else if (other.bbox.y0 >= block.bbox.y1 - 0.5f) {
                below = std::min(below, other.bbox.y0 - block.bbox.y1);
            }
        }
        block.space_above = std::max(0.0f, above);
        block.space_below = std::max(0.0f, below);
        block.order = static_cast<int>(i);
    }

    return blocks;
}

} // namespace pdf_outline
