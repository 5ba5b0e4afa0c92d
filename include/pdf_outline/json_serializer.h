#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "pdf_outline/types.h"

namespace pdf_outline {

class JsonSerializer {
public:
    // {"title": "...", "outline": [{"level": "H1", "text": "...", "page": 0}]}
    // include_diagnostics adds "partial", "warnings" and "stats".
    static std::string serialize_outline(const Outline& outline,
                                         bool pretty = false,
                                         bool include_diagnostics = false);

    // Span dump: {"pages": [{"page": 0, "width": .., "height": .., "spans": [...]}]}
    // Throws MalformedDocumentError on a missing or mistyped field.
    static std::vector<PageSpans> parse_pages(const nlohmann::json& dump);
    static std::vector<PageSpans> load_pages(const std::string& path);

    static nlohmann::json pages_to_json(const std::vector<PageSpans>& pages);
};

} // namespace pdf_outline
