#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "pdf_outline/candidate_filter.h"
#include "pdf_outline/consolidator.h"
#include "pdf_outline/errors.h"
#include "pdf_outline/feature_scorer.h"
#include "pdf_outline/hierarchy_classifier.h"
#include "pdf_outline/outline_assembler.h"
#include "pdf_outline/types.h"

namespace pdf_outline {

struct OutlineOptions {
    int page_limit = 50;
    size_t memory_limit_mb = 200;
    std::chrono::milliseconds time_limit{10000};
    bool verbose = false;
    size_t thread_count = 1;     // PDF page decoding only

    ConsolidatorOptions consolidator;
    ProfileOptions profile;
    ScoringOptions scoring;
    FilterOptions filter;
    ClassifierOptions classifier;
    AssemblerOptions assembler;
};

// Diagnostic kind a document-level failure is reported as
DiagnosticKind diagnostic_kind(const OutlineError& error);

// Runs the whole pipeline: spans -> blocks -> scored candidates -> levels ->
// outline. Malformed pages and exhausted budgets become diagnostics on the
// returned outline; only InvariantViolation escapes.
class OutlineExtractor {
public:
    explicit OutlineExtractor(const OutlineOptions& options = OutlineOptions{});
    ~OutlineExtractor();

    Outline extract(const std::string& pdf_path);
    Outline extract_pages(const std::vector<PageSpans>& pages);

    // Totals over every document this extractor has processed
    nlohmann::json get_stats() const;

    const OutlineOptions& options() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace pdf_outline
