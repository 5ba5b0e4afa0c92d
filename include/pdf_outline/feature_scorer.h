#pragma once

#include <map>
#include <string>
#include <vector>
#include "pdf_outline/types.h"

namespace pdf_outline {

// Per-document statistics, computed once after every page has been
// consolidated and then passed read-only to the scorer, filter and classifier.
struct DocumentProfile {
    // Block font sizes weighted by character count, so body text dominates
    float body_size = 0.0f;  // 50th percentile
    float p75 = 0.0f;
    float p90 = 0.0f;
    float p95 = 0.0f;

    int page_count = 0;
    int first_page = 0;
    int block_count = 0;

    // Fraction of blocks set in each font
    std::map<std::string, float> font_share;

    // Text of running headers/footers and the vertical positions they repeat at
    std::map<std::string, std::vector<float>> repeated_positions;
    float repeat_tolerance = 4.0f;

    float share_of(const std::string& font_name) const;
    bool is_repeated(const Block& block) const;
};

struct ProfileOptions {
    int min_repeat_pages = 3;
    float repeat_tolerance = 4.0f;  // points
};

DocumentProfile build_document_profile(const std::vector<std::vector<Block>>& pages,
                                       const ProfileOptions& options = ProfileOptions{});

// Character-weighted percentile (0..100) of (size, weight) samples
float weighted_percentile(std::vector<std::pair<float, size_t>> samples, float percentile);

struct ScoringOptions {
    float font_weight = 0.40f;
    float content_weight = 0.35f;
    float layout_weight = 0.25f;

    float size_ratio_span = 0.6f;     // size/body ratio above 1 that saturates the size part
    float rare_font_share = 0.05f;
    int short_words = 6;
    int max_heading_words = 12;
    int long_words = 20;
    int long_chars = 150;

    // Whitespace around the block, as ratios to the body size
    float wide_space_above = 1.5f;
    float space_above = 0.8f;
    float space_below = 0.8f;
    float narrow_space_below = 0.4f;
};

float font_score(const Block& block, const DocumentProfile& profile, const ScoringOptions& options);
float content_score(const Block& block, Script script, const ScoringOptions& options);
float layout_score(const Block& block, Script script, const DocumentProfile& profile,
                   const ScoringOptions& options);

// Detects the block's script and fills every score of the candidate.
// Deterministic and free of side effects.
Candidate score_block(const Block& block, const DocumentProfile& profile,
                      const ScoringOptions& options = ScoringOptions{});

} // namespace pdf_outline
