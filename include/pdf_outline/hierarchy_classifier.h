#pragma once

#include <optional>
#include <vector>
#include "pdf_outline/feature_scorer.h"
#include "pdf_outline/types.h"

namespace pdf_outline {

struct ClassifierOptions {
    float tier_tolerance = 0.75f;            // sizes this close share a tier above p95
    float content_promotion_margin = 0.3f;
    float equal_size_tolerance = 0.1f;       // overrides only compare sizes this close
    float title_size_tolerance = 0.5f;
};

struct Classification {
    std::optional<Candidate> title;
    std::vector<Heading> headings;           // document order, not yet sorted by position
    int tier_count = 0;
};

/**
 * Picks the title, buckets the remaining candidates into font-size tiers and
 * maps the tiers onto H1..H3. Among tier members of equal font size the
 * numbering depth (or, failing that, a clearly higher content score) can move
 * a heading one level, but never outside the ladder of levels the tiers
 * produced.
 *
 * Throws InvariantViolation for a candidate whose script was never detected.
 */
Classification classify(std::vector<Candidate> candidates,
                        const DocumentProfile& profile,
                        const ClassifierOptions& options = ClassifierOptions{});

} // namespace pdf_outline
