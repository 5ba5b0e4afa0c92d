#pragma once

#include <algorithm>
#include <string>
#include <vector>

namespace pdf_outline {

// Coordinates are PDF points with y growing downward (MuPDF convention)
struct BBox {
    float x0 = 0.0f;
    float y0 = 0.0f;
    float x1 = 0.0f;
    float y1 = 0.0f;

    float width() const { return x1 - x0; }
    float height() const { return y1 - y0; }
    float center_x() const { return (x0 + x1) * 0.5f; }
    float center_y() const { return (y0 + y1) * 0.5f; }

    BBox united(const BBox& other) const {
        return {std::min(x0, other.x0), std::min(y0, other.y0),
                std::max(x1, other.x1), std::max(y1, other.y1)};
    }
};

struct Span {
    std::string text;
    float font_size = 0.0f;
    std::string font_name;
    bool bold = false;
    bool italic = false;
    bool monospace = false;
    BBox bbox;
    int page = 0;
};

struct PageSpans {
    int page = 0;
    float width = 0.0f;   // 0 when the decoder did not report it
    float height = 0.0f;
    std::vector<Span> spans;
    std::string error;    // set when the page could not be decoded
};

struct Line {
    std::vector<Span> spans;
    std::string text;
    float font_size = 0.0f;
    std::string font_name;
    bool bold = false;
    bool italic = false;
    BBox bbox;
};

struct Block {
    std::string text;
    float font_size = 0.0f;
    std::string font_name;
    bool bold = false;
    bool italic = false;
    BBox bbox;
    int page = 0;
    int order = 0;           // reading order within the document
    int line_count = 0;
    int char_count = 0;      // code points
    float size_spread = 0.0f;
    float indent = 0.0f;
    bool centered = false;
    float space_above = 0.0f;
    float space_below = 0.0f;
};

enum class Script {
    Unclassified,
    Latin,
    Cyrillic,
    Greek,
    Arabic,
    Hebrew,
    Devanagari,
    Cjk,
    Hangul,
    Thai,
    Other
};

const char* to_string(Script script);

struct Candidate {
    Block block;
    Script script = Script::Unclassified;
    int numbering_depth = 0;
    float font_score = 0.0f;
    float content_score = 0.0f;
    float layout_score = 0.0f;
    float score = 0.0f;
    int tier = -1;           // assigned by the classifier
};

enum class HeadingLevel {
    Title,
    H1,
    H2,
    H3
};

const char* to_string(HeadingLevel level);

struct Heading {
    HeadingLevel level = HeadingLevel::H1;
    std::string text;
    int page = 0;
    float y = 0.0f;
    float font_size = 0.0f;
    int order = 0;
};

enum class DiagnosticKind {
    MalformedDocument,
    UnsupportedDocument,
    ResourceExceeded
};

const char* to_string(DiagnosticKind kind);

struct Diagnostic {
    DiagnosticKind kind;
    int page = -1;           // -1 for document-level diagnostics
    std::string message;
};

struct OutlineStats {
    int pages_processed = 0;
    int blocks_seen = 0;
    int candidates_kept = 0;
    double processing_time_ms = 0.0;
};

struct Outline {
    std::string title;
    std::vector<Heading> headings;
    bool partial = false;
    std::vector<Diagnostic> diagnostics;
    OutlineStats stats;
};

} // namespace pdf_outline
