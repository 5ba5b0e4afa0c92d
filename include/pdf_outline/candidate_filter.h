#pragma once

#include <optional>
#include <vector>
#include "pdf_outline/feature_scorer.h"
#include "pdf_outline/types.h"

namespace pdf_outline {

enum class ExclusionReason {
    LowScore,
    TooShort,
    PageNumber,
    UrlOrEmail,
    RepeatedHeaderFooter,
    Caption,
    Boilerplate,
    NumericDominated,
    TooLong,
    Fragment
};

const char* to_string(ExclusionReason reason);

struct FilterOptions {
    float min_score = 0.45f;
    int min_chars = 2;
    int max_heading_chars = 250;
    int max_heading_words = 25;
    float numeric_ratio = 0.4f;   // digits and currency over visible characters
};

// Why a candidate cannot be a heading, or nullopt when it survives.
// Pattern exclusions apply whatever the score.
std::optional<ExclusionReason> exclusion_reason(const Candidate& candidate,
                                                const DocumentProfile& profile,
                                                const FilterOptions& options = FilterOptions{});

// Keeps the survivors in their original order
std::vector<Candidate> filter_candidates(std::vector<Candidate> candidates,
                                         const DocumentProfile& profile,
                                         const FilterOptions& options = FilterOptions{});

} // namespace pdf_outline
