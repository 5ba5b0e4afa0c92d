#include "pdf_outline/json_serializer.h"
#include "pdf_outline/errors.h"
#include "pdf_outline/json_types.h"
#include <fstream>

namespace pdf_outline {

namespace {

Span parse_span(const nlohmann::json& item, int page) {
    Span span;
    span.text = item.at("text").get<std::string>();
    span.font_size = item.at("size").get<float>();
    span.font_name = item.value("font", std::string());
    span.bold = item.value("bold", false);
    span.italic = item.value("italic", false);
    span.monospace = item.value("monospace", false);
    span.page = page;

    const auto& bbox = item.at("bbox");
    if (!bbox.is_array() || bbox.size() != 4) {
        throw MalformedDocumentError("span bbox must be [x0, y0, x1, y1]", page);
    }
    span.bbox = {bbox[0].get<float>(), bbox[1].get<float>(), bbox[2].get<float>(), bbox[3].get<float>()};
    return span;
}

} // namespace

std::string JsonSerializer::serialize_outline(const Outline& outline, bool pretty, bool include_diagnostics) {
    JsonBuilder builder;
    JsonAllocator& alloc = builder.allocator();

    builder.add("title", builder.string(outline.title));

    JsonValue entries(rapidjson::kArrayType);
    for (const auto& heading : outline.headings) {
        JsonValue entry(rapidjson::kObjectType);
        builder.add(entry, "level", JsonValue(rapidjson::StringRef(to_string(heading.level))));
        builder.add(entry, "text", builder.string(heading.text));
        builder.add(entry, "page", JsonValue(heading.page));
        entries.PushBack(entry, alloc);
    }
    builder.add("outline", std::move(entries));

    if (include_diagnostics) {
        builder.add("partial", JsonValue(outline.partial));

        JsonValue warnings(rapidjson::kArrayType);
        for (const auto& diagnostic : outline.diagnostics) {
            JsonValue warning(rapidjson::kObjectType);
            builder.add(warning, "kind", JsonValue(rapidjson::StringRef(to_string(diagnostic.kind))));
            builder.add(warning, "page", JsonValue(diagnostic.page));
            builder.add(warning, "message", builder.string(diagnostic.message));
            warnings.PushBack(warning, alloc);
        }
        builder.add("warnings", std::move(warnings));

        JsonValue stats(rapidjson::kObjectType);
        builder.add(stats, "pages_processed", JsonValue(outline.stats.pages_processed));
        builder.add(stats, "blocks_seen", JsonValue(outline.stats.blocks_seen));
        builder.add(stats, "candidates_kept", JsonValue(outline.stats.candidates_kept));
        builder.add(stats, "processing_time_ms", JsonValue(outline.stats.processing_time_ms));
        builder.add("stats", std::move(stats));
    }

    return builder.serialize(pretty);
}

std::vector<PageSpans> JsonSerializer::parse_pages(const nlohmann::json& dump) {
    if (!dump.is_object() || !dump.contains("pages") || !dump["pages"].is_array()) {
        throw MalformedDocumentError("span dump must be an object with a \"pages\" array");
    }

    std::vector<PageSpans> pages;
    int position = 0;
    for (const auto& item : dump["pages"]) {
        PageSpans page;
        try {
            page.page = item.value("page", position);
            page.width = item.value("width", 0.0f);
            page.height = item.value("height", 0.0f);
            page.error = item.value("error", std::string());
            if (item.contains("spans")) {
                for (const auto& span : item.at("spans")) {
                    page.spans.push_back(parse_span(span, page.page));
                }
            }
        } catch (const nlohmann::json::exception& e) {
            throw MalformedDocumentError(std::string("invalid span dump: ") + e.what(), position);
        }
        pages.push_back(std::move(page));
        position++;
    }
    return pages;
}

std::vector<PageSpans> JsonSerializer::load_pages(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw MalformedDocumentError("cannot open span dump: " + path);
    }

    nlohmann::json dump;
    try {
        file >> dump;
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedDocumentError("cannot parse span dump " + path + ": " + e.what());
    }
    return parse_pages(dump);
}

nlohmann::json JsonSerializer::pages_to_json(const std::vector<PageSpans>& pages) {
    nlohmann::json dump;
    dump["pages"] = nlohmann::json::array();

    for (const auto& page : pages) {
        nlohmann::json page_json;
        page_json["page"] = page.page;
        page_json["width"] = page.width;
        page_json["height"] = page.height;
        if (!page.error.empty()) {
            page_json["error"] = page.error;
        }
        page_json["spans"] = nlohmann::json::array();
        for (const auto& span : page.spans) {
            page_json["spans"].push_back({
                {"text", span.text},
                {"size", span.font_size},
                {"font", span.font_name},
                {"bold", span.bold},
                {"italic", span.italic},
                {"monospace", span.monospace},
                {"bbox", {span.bbox.x0, span.bbox.y0, span.bbox.x1, span.bbox.y1}}
            });
        }
        dump["pages"].push_back(page_json);
    }
    return dump;
}

} // namespace pdf_outline
