#include "pdf_outline/outline_extractor.h"
#include "pdf_outline/errors.h"
#include "pdf_outline/text_extractor.h"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace pdf_outline {

using Clock = std::chrono::steady_clock;

DiagnosticKind diagnostic_kind(const OutlineError& error) {
    if (dynamic_cast<const UnsupportedDocumentError*>(&error)) {
        return DiagnosticKind::UnsupportedDocument;
    }
    if (dynamic_cast<const ResourceExceededError*>(&error)) {
        return DiagnosticKind::ResourceExceeded;
    }
    return DiagnosticKind::MalformedDocument;
}

class OutlineExtractor::Impl {
public:
    explicit Impl(const OutlineOptions& options) : options_(options) {
        stats_["documents_processed"] = 0;
        stats_["pages_processed"] = 0;
        stats_["headings_emitted"] = 0;
        stats_["total_processing_time_ms"] = 0.0;
    }

    Outline extract(const std::string& pdf_path) {
        auto start_time = Clock::now();
        std::vector<Diagnostic> diagnostics;
        std::vector<PageSpans> pages;
        bool partial = false;

        if (!std::filesystem::exists(pdf_path)) {
            warn(diagnostics, DiagnosticKind::MalformedDocument, -1, "PDF file not found: " + pdf_path);
            return finish(run({}, start_time, false), std::move(diagnostics), partial, start_time);
        }

        try {
            TextExtractor extractor(options_.verbose);
            int page_count = extractor.get_page_count(pdf_path);

            ExtractOptions extract_opts;
            extract_opts.page_limit = std::max(0, options_.page_limit);
            extract_opts.thread_count = options_.thread_count;
            extract_opts.verbose = options_.verbose;
            extract_opts.should_continue = [this, start_time](int) {
                return !time_exceeded(start_time);
            };
            pages = extractor.extract_all_pages(pdf_path, extract_opts);

            int expected = std::max(0, std::min(page_count, options_.page_limit));
            if (page_count > options_.page_limit) {
                partial = true;
                warn(diagnostics, DiagnosticKind::ResourceExceeded, -1,
                     "document has " + std::to_string(page_count) + " pages, only the first " +
                     std::to_string(options_.page_limit) + " were processed");
            }
            if (static_cast<int>(pages.size()) < expected) {
                partial = true;
                warn(diagnostics, DiagnosticKind::ResourceExceeded, static_cast<int>(pages.size()),
                     "time limit of " + std::to_string(options_.time_limit.count()) +
                     " ms reached while decoding pages");
            }
        } catch (const InvariantViolation&) {
            throw;
        } catch (const MalformedDocumentError& e) {
            warn(diagnostics, DiagnosticKind::MalformedDocument, e.page(), e.what());
        } catch (const OutlineError& e) {
            DiagnosticKind kind = diagnostic_kind(e);
            partial = partial || kind == DiagnosticKind::ResourceExceeded;
            warn(diagnostics, kind, -1, e.what());
        }

        // Decoding already honoured the time budget
        return finish(run(pages, start_time, false), std::move(diagnostics), partial, start_time);
    }

    Outline extract_pages(const std::vector<PageSpans>& pages) {
        auto start_time = Clock::now();
        return finish(run(pages, start_time, true), {}, false, start_time);
    }

    nlohmann::json get_stats() const {
        nlohmann::json stats = stats_;

        if (stats["documents_processed"] > 0) {
            double avg_time = stats["total_processing_time_ms"].get<double>() /
                              stats["documents_processed"].get<double>();
            stats["average_processing_time_ms"] = avg_time;

            double total_ms = stats["total_processing_time_ms"].get<double>();
            if (total_ms > 0.0) {
                stats["pages_per_second"] = stats["pages_processed"].get<double>() / (total_ms / 1000.0);
            }
        }

        return stats;
    }

    const OutlineOptions& options() const { return options_; }

private:
    bool time_exceeded(Clock::time_point start_time) const {
        return Clock::now() - start_time >= options_.time_limit;
    }

    // Throws ResourceExceededError once a budget is used up
    void check_budgets(Clock::time_point start_time, bool enforce_time, size_t memory_bytes) const {
        if (enforce_time && time_exceeded(start_time)) {
            throw ResourceExceededError("time limit of " + std::to_string(options_.time_limit.count()) +
                                        " ms reached");
        }
        if (memory_bytes > options_.memory_limit_mb * 1024 * 1024) {
            throw ResourceExceededError("memory limit of " + std::to_string(options_.memory_limit_mb) +
                                        " MB reached");
        }
    }

    void warn(std::vector<Diagnostic>& diagnostics, DiagnosticKind kind, int page, const std::string& message) const {
        if (options_.verbose) {
            std::cerr << "[OutlineExtractor] Warning (" << to_string(kind) << ")";
            if (page >= 0) {
                std::cerr << " page " << page;
            }
            std::cerr << ": " << message << std::endl;
        }
        diagnostics.push_back({kind, page, message});
    }

    Outline run(const std::vector<PageSpans>& input, Clock::time_point start_time, bool enforce_time) {
        std::vector<Diagnostic> diagnostics;
        bool partial = false;
        OutlineStats stats;

        std::vector<const PageSpans*> ordered;
        ordered.reserve(input.size());
        int dropped = 0;
        for (const auto& page : input) {
            if (page.page >= options_.page_limit) {
                dropped++;
                continue;
            }
            ordered.push_back(&page);
        }
        std::stable_sort(ordered.begin(), ordered.end(),
                         [](const PageSpans* a, const PageSpans* b) { return a->page < b->page; });
        if (dropped > 0) {
            partial = true;
            warn(diagnostics, DiagnosticKind::ResourceExceeded, -1,
                 std::to_string(dropped) + " pages beyond the page limit of " +
                 std::to_string(options_.page_limit) + " were not processed");
        }

        // Pass 1: consolidate spans into blocks page by page
        size_t memory_bytes = 0;
        std::vector<std::vector<Block>> blocks_by_page;
        for (const PageSpans* page : ordered) {
            try {
                check_budgets(start_time, enforce_time, memory_bytes);
            } catch (const ResourceExceededError& e) {
                partial = true;
                warn(diagnostics, DiagnosticKind::ResourceExceeded, page->page, e.what());
                break;
            }
            if (page->page < 0 || !page->error.empty()) {
                warn(diagnostics, DiagnosticKind::MalformedDocument, page->page,
                     page->error.empty() ? "invalid page index" : "page skipped: " + page->error);
                continue;
            }

            std::vector<Block> blocks = consolidate_page(*page, options_.consolidator);
            for (const auto& block : blocks) {
                memory_bytes += block.text.size() + sizeof(Block);
            }
            stats.pages_processed++;
            stats.blocks_seen += static_cast<int>(blocks.size());
            if (options_.verbose) {
                std::cout << "[OutlineExtractor::run] Page " << page->page << ": " << page->spans.size()
                          << " spans -> " << blocks.size() << " blocks" << std::endl;
            }
            if (!blocks.empty()) {
                blocks_by_page.push_back(std::move(blocks));
            }
        }

        if (stats.pages_processed > 0 && blocks_by_page.empty()) {
            warn(diagnostics, DiagnosticKind::UnsupportedDocument, -1, "no extractable text");
        }

        // Document order across pages
        int order = 0;
        for (auto& blocks : blocks_by_page) {
            for (auto& block : blocks) {
                block.order = order++;
            }
        }

        // Pass 2: document statistics, scoring and filtering
        DocumentProfile profile = build_document_profile(blocks_by_page, options_.profile);
        std::vector<Candidate> candidates;
        candidates.reserve(stats.blocks_seen);
        for (const auto& blocks : blocks_by_page) {
            for (const auto& block : blocks) {
                candidates.push_back(score_block(block, profile, options_.scoring));
            }
        }
        candidates = filter_candidates(std::move(candidates), profile, options_.filter);
        stats.candidates_kept = static_cast<int>(candidates.size());
        if (options_.verbose) {
            std::cout << "[OutlineExtractor::run] Body size " << profile.body_size << "pt, "
                      << stats.candidates_kept << "/" << stats.blocks_seen << " blocks kept" << std::endl;
        }

        // Pass 3: levels and final ordering
        Classification classification = classify(std::move(candidates), profile, options_.classifier);
        if (options_.verbose) {
            std::cout << "[OutlineExtractor::run] " << classification.tier_count << " font tiers, "
                      << (classification.title ? "title found" : "no title") << std::endl;
        }
        Outline outline = assemble_outline(std::move(classification), options_.assembler);
        outline.diagnostics = std::move(diagnostics);
        outline.partial = partial;
        outline.stats = stats;
        return outline;
    }

    Outline finish(Outline outline, std::vector<Diagnostic> diagnostics, bool partial,
                   Clock::time_point start_time) {
        diagnostics.insert(diagnostics.end(), outline.diagnostics.begin(), outline.diagnostics.end());
        outline.diagnostics = std::move(diagnostics);
        outline.partial = outline.partial || partial;

        auto duration = std::chrono::duration<double, std::milli>(Clock::now() - start_time);
        outline.stats.processing_time_ms = duration.count();

        stats_["documents_processed"] = stats_["documents_processed"].get<int>() + 1;
        stats_["pages_processed"] = stats_["pages_processed"].get<int>() + outline.stats.pages_processed;
        stats_["headings_emitted"] = stats_["headings_emitted"].get<int>() +
                                     static_cast<int>(outline.headings.size());
        stats_["total_processing_time_ms"] = stats_["total_processing_time_ms"].get<double>() + duration.count();

        if (options_.verbose) {
            std::cout << "[OutlineExtractor::finish] " << outline.headings.size() << " headings in "
                      << duration.count() << " ms" << (outline.partial ? " (partial)" : "") << std::endl;
        }
        return outline;
    }

    OutlineOptions options_;
    nlohmann::json stats_;
};

OutlineExtractor::OutlineExtractor(const OutlineOptions& options)
    : pImpl(std::make_unique<Impl>(options)) {}

OutlineExtractor::~OutlineExtractor() = default;

Outline OutlineExtractor::extract(const std::string& pdf_path) {
    return pImpl->extract(pdf_path);
}

Outline OutlineExtractor::extract_pages(const std::vector<PageSpans>& pages) {
    return pImpl->extract_pages(pages);
}

nlohmann::json OutlineExtractor::get_stats() const {
    return pImpl->get_stats();
}

const OutlineOptions& OutlineExtractor::options() const {
    return pImpl->options();
}

} // namespace pdf_outline
