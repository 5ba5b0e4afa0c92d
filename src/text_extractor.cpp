#include "pdf_outline/text_extractor.h"
#include "pdf_outline/errors.h"
#include "pdf_outline/thread_pool.h"
#include <mupdf/fitz.h>
#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>
#include <optional>

namespace pdf_outline {

namespace {

// Drops the document when the scope ends, whichever way it ends
struct DocumentHandle {
    fz_context* ctx;
    fz_document* doc;

    ~DocumentHandle() {
        if (doc) fz_drop_document(ctx, doc);
    }
};

// "ABCDEF+Helvetica-Bold" -> "Helvetica-Bold"
std::string strip_subset_prefix(const std::string& name) {
    if (name.size() > 7 && name[6] == '+' &&
        std::all_of(name.begin(), name.begin() + 6, [](char c) { return c >= 'A' && c <= 'Z'; })) {
        return name.substr(7);
    }
    return name;
}

bool name_contains(const std::string& name, const char* marker) {
    return name.find(marker) != std::string::npos;
}

} // namespace

class TextExtractor::Impl {
public:
    explicit Impl(bool verbose) : verbose_(verbose) {
        ctx = fz_new_context(NULL, NULL, FZ_STORE_UNLIMITED);
        if (!ctx) {
            throw ResourceExceededError("Failed to create MuPDF context");
        }
        fz_register_document_handlers(ctx);
    }

    ~Impl() {
        if (ctx) {
            fz_drop_context(ctx);
        }
    }

    fz_document* open(const std::string& pdf_path) {
        fz_document* doc = nullptr;
        int needs_password = 0;
        bool failed = false;
        std::string message;

        fz_var(doc);

        fz_try(ctx) {
            doc = fz_open_document(ctx, pdf_path.c_str());
            needs_password = fz_needs_password(ctx, doc);
        }
        fz_catch(ctx) {
            failed = true;
            message = fz_caught_message(ctx);
        }

        if (failed) {
            if (doc) fz_drop_document(ctx, doc);
            throw MalformedDocumentError("Failed to open PDF document " + pdf_path + ": " + message);
        }
        if (needs_password) {
            fz_drop_document(ctx, doc);
            throw UnsupportedDocumentError("PDF document is password protected: " + pdf_path);
        }
        return doc;
    }

    int count_pages(fz_document* doc) {
        int page_count = 0;
        bool failed = false;
        std::string message;

        fz_try(ctx) {
            page_count = fz_count_pages(ctx, doc);
        }
        fz_catch(ctx) {
            failed = true;
            message = fz_caught_message(ctx);
        }

        if (failed) {
            throw MalformedDocumentError("MuPDF error getting page count: " + message);
        }
        return page_count;
    }

    PageSpans read_page(fz_document* doc, int page_number) {
        PageSpans result;
        result.page = page_number;

        fz_page* page = nullptr;
        fz_stext_page* stext = nullptr;
        bool failed = false;
        std::string message;

        fz_var(page);
        fz_var(stext);

        fz_try(ctx) {
            page = fz_load_page(ctx, doc, page_number);
            fz_rect bounds = fz_bound_page(ctx, page);
            result.width = bounds.x1 - bounds.x0;
            result.height = bounds.y1 - bounds.y0;

            fz_stext_options opts = { 0 };
            opts.flags = FZ_STEXT_PRESERVE_LIGATURES | FZ_STEXT_PRESERVE_WHITESPACE;

            stext = fz_new_stext_page_from_page(ctx, page, &opts);
            collect_spans(stext, page_number, result.spans);
        }
        fz_always(ctx) {
            if (stext) fz_drop_stext_page(ctx, stext);
            if (page) fz_drop_page(ctx, page);
        }
        fz_catch(ctx) {
            failed = true;
            message = fz_caught_message(ctx);
        }

        if (failed) {
            result.spans.clear();
            result.error = message.empty() ? "MuPDF error during text extraction" : message;
            if (verbose_) {
                std::cerr << "[TextExtractor::read_page] Page " << page_number << ": " << result.error << std::endl;
            }
        }
        return result;
    }

    PageSpans extract_page(const std::string& pdf_path, int page_number) {
        DocumentHandle handle{ctx, open(pdf_path)};
        int page_count = count_pages(handle.doc);
        if (page_number < 0 || page_number >= page_count) {
            throw MalformedDocumentError("Page number out of range", page_number);
        }
        return read_page(handle.doc, page_number);
    }

    std::vector<PageSpans> extract_all_pages(const std::string& pdf_path, const ExtractOptions& options) {
        if (verbose_) {
            std::cout << "[TextExtractor::extract_all_pages] Starting extraction from " << pdf_path << std::endl;
        }

        DocumentHandle handle{ctx, open(pdf_path)};
        int page_count = count_pages(handle.doc);
        int limit = options.page_limit >= 0 ? std::min(page_count, options.page_limit) : page_count;
        if (verbose_) {
            std::cout << "[TextExtractor::extract_all_pages] Document has " << page_count
                      << " pages, extracting " << limit << std::endl;
        }

        if (options.thread_count > 1 && limit > 1) {
            return extract_parallel(pdf_path, limit, options);
        }

        std::vector<PageSpans> pages;
        pages.reserve(limit);
        for (int i = 0; i < limit; ++i) {
            if (options.should_continue && !options.should_continue(i)) {
                break;
            }
            if (verbose_ && i % 50 == 0) {
                std::cout << "[TextExtractor::extract_all_pages] Processing page " << i << "/" << limit << std::endl;
            }
            pages.push_back(read_page(handle.doc, i));
        }
        return pages;
    }

    int get_page_count(const std::string& pdf_path) {
        DocumentHandle handle{ctx, open(pdf_path)};
        return count_pages(handle.doc);
    }

private:
    // Each worker opens the document in its own context
    std::vector<PageSpans> extract_parallel(const std::string& pdf_path, int limit, const ExtractOptions& options) {
        ThreadPool pool(options.thread_count);
        std::vector<std::future<std::optional<PageSpans>>> futures;
        futures.reserve(limit);

        for (int i = 0; i < limit; ++i) {
            futures.push_back(pool.enqueue([&pdf_path, &options, i]() -> std::optional<PageSpans> {
                if (options.should_continue && !options.should_continue(i)) {
                    return std::nullopt;
                }
                try {
                    TextExtractor worker;
                    return worker.extract_page(pdf_path, i);
                } catch (const OutlineError& e) {
                    PageSpans failed;
                    failed.page = i;
                    failed.error = e.what();
                    return failed;
                }
            }));
        }

        // Keep the longest prefix of pages that were not cancelled
        std::vector<PageSpans> pages;
        bool cancelled = false;
        for (auto& future : futures) {
            std::optional<PageSpans> page = future.get();
            if (!page) {
                cancelled = true;
            }
            if (!cancelled) {
                pages.push_back(std::move(*page));
            }
        }
        return pages;
    }

    void collect_spans(fz_stext_page* stext, int page_number, std::vector<Span>& spans) {
        for (fz_stext_block* block = stext->first_block; block; block = block->next) {
            if (block->type != FZ_STEXT_BLOCK_TEXT) {
                continue;
            }
            for (fz_stext_line* line = block->u.t.first_line; line; line = line->next) {
                Span current;
                fz_font* current_font = nullptr;
                bool open_span = false;

                for (fz_stext_char* ch = line->first_char; ch; ch = ch->next) {
                    char utf8[8] = {0};
                    int len = fz_runetochar(utf8, ch->c);
                    fz_rect box = fz_rect_from_quad(ch->quad);

                    if (!open_span || ch->font != current_font || std::fabs(ch->size - current.font_size) > 0.01f) {
                        if (open_span) {
                            spans.push_back(std::move(current));
                        }
                        current = start_span(ch, page_number);
                        current.bbox = {box.x0, box.y0, box.x1, box.y1};
                        current_font = ch->font;
                        open_span = true;
                    } else {
                        current.bbox = current.bbox.united({box.x0, box.y0, box.x1, box.y1});
                    }
                    current.text.append(utf8, len);
                }
                if (open_span) {
                    spans.push_back(std::move(current));
                }
            }
        }
    }

    Span start_span(fz_stext_char* ch, int page_number) {
        Span span;
        span.font_size = ch->size;
        span.page = page_number;
        if (!ch->font) {
            span.font_name = "unknown";
            return span;
        }
        const char* name = fz_font_name(ctx, ch->font);
        span.font_name = strip_subset_prefix(name ? name : "unknown");
        span.bold = fz_font_is_bold(ctx, ch->font) || name_contains(span.font_name, "Bold") ||
                    name_contains(span.font_name, "Black") || name_contains(span.font_name, "Heavy") ||
                    name_contains(span.font_name, "Semibold");
        span.italic = fz_font_is_italic(ctx, ch->font) || name_contains(span.font_name, "Italic") ||
                      name_contains(span.font_name, "Oblique");
        span.monospace = fz_font_is_monospaced(ctx, ch->font);
        return span;
    }

    bool verbose_;

public:
    fz_context* ctx;
};

TextExtractor::TextExtractor(bool verbose) : pImpl(std::make_unique<Impl>(verbose)) {}
TextExtractor::~TextExtractor() = default;

PageSpans TextExtractor::extract_page(const std::string& pdf_path, int page_number) {
    return pImpl->extract_page(pdf_path, page_number);
}

std::vector<PageSpans> TextExtractor::extract_all_pages(const std::string& pdf_path,
                                                        const ExtractOptions& options) {
    return pImpl->extract_all_pages(pdf_path, options);
}

int TextExtractor::get_page_count(const std::string& pdf_path) {
    return pImpl->get_page_count(pdf_path);
}

} // namespace pdf_outline
