#include "pdf_outline/hierarchy_classifier.h"
#include "pdf_outline/errors.h"
#include <algorithm>
#include <cmath>

namespace pdf_outline {

const char* to_string(HeadingLevel level) {
    switch (level) {
        case HeadingLevel::Title: return "Title";
        case HeadingLevel::H1: return "H1";
        case HeadingLevel::H2: return "H2";
        case HeadingLevel::H3: return "H3";
    }
    return "H3";
}

namespace {

constexpr int kDeepestLevel = 3;

struct Tier {
    float top_size = 0.0f;
    std::vector<size_t> members;   // indices into the candidate list
};

bool earlier(const Candidate& a, const Candidate& b) {
    if (a.block.page != b.block.page) {
        return a.block.page < b.block.page;
    }
    return a.block.order < b.block.order;
}

// Removes the title block from the candidates. Returns nullopt when no
// first-page size dominates the document.
std::optional<Candidate> take_title(std::vector<Candidate>& candidates,
                                    const DocumentProfile& profile,
                                    const ClassifierOptions& options) {
    int first_page = profile.first_page;
    if (profile.page_count == 0) {
        first_page = candidates.front().block.page;
        for (const auto& candidate : candidates) {
            first_page = std::min(first_page, candidate.block.page);
        }
    }

    float title_size = 0.0f;
    bool any_on_first = false;
    for (const auto& candidate : candidates) {
        if (candidate.block.page == first_page) {
            title_size = std::max(title_size, candidate.block.font_size);
            any_on_first = true;
        }
    }
    if (!any_on_first) {
        return std::nullopt;
    }

    auto title_sized = [&](const Candidate& candidate) {
        return candidate.block.font_size >= title_size - options.title_size_tolerance;
    };
    for (const auto& candidate : candidates) {
        if (candidate.block.page != first_page && title_sized(candidate)) {
            return std::nullopt;
        }
    }

    const Candidate* best = nullptr;
    for (const auto& candidate : candidates) {
        if (candidate.block.page != first_page || !title_sized(candidate)) {
            continue;
        }
        if (best == nullptr || candidate.score > best->score ||
            (candidate.score == best->score && earlier(candidate, *best))) {
            best = &candidate;
        }
    }
    Candidate title = *best;
    candidates.erase(candidates.begin() + (best - candidates.data()));
    return title;
}

std::vector<Tier> build_tiers(const std::vector<Candidate>& candidates,
                              const DocumentProfile& profile,
                              const ClassifierOptions& options) {
    // Fixed bands at or below p95
    Tier bands[3];
    std::vector<size_t> upper;
    for (size_t i = 0; i < candidates.size(); ++i) {
        float size = candidates[i].block.font_size;
        Tier* band = nullptr;
        if (size <= profile.p75) {
            band = &bands[0];
        } else if (size <= profile.p90) {
            band = &bands[1];
        } else if (size <= profile.p95) {
            band = &bands[2];
        } else {
            upper.push_back(i);
            continue;
        }
        band->members.push_back(i);
        band->top_size = std::max(band->top_size, size);
    }

    // Above p95 every distinct size is its own tier
    std::stable_sort(upper.begin(), upper.end(), [&](size_t a, size_t b) {
        return candidates[a].block.font_size > candidates[b].block.font_size;
    });
    std::vector<Tier> tiers;
    for (size_t index : upper) {
        float size = candidates[index].block.font_size;
        if (tiers.empty() || tiers.back().top_size - size > options.tier_tolerance) {
            Tier tier;
            tier.top_size = size;
            tiers.push_back(tier);
        }
        tiers.back().members.push_back(index);
    }
    for (int b = 2; b >= 0; --b) {
        if (!bands[b].members.empty()) {
            tiers.push_back(bands[b]);
        }
    }
    return tiers;
}

float median(std::vector<float> values) {
    if (values.empty()) {
        return 0.0f;
    }
    std::sort(values.begin(), values.end());
    size_t mid = values.size() / 2;
    if (values.size() % 2 == 0) {
        return (values[mid - 1] + values[mid]) * 0.5f;
    }
    return values[mid];
}

// Tier members of one font size; only these are compared by the overrides
std::vector<std::vector<size_t>> same_size_groups(const Tier& tier, const std::vector<Candidate>& candidates,
                                                  float tolerance) {
    std::vector<size_t> members = tier.members;
    std::stable_sort(members.begin(), members.end(), [&](size_t a, size_t b) {
        return candidates[a].block.font_size > candidates[b].block.font_size;
    });

    std::vector<std::vector<size_t>> groups;
    float group_size = 0.0f;
    for (size_t index : members) {
        float size = candidates[index].block.font_size;
        if (groups.empty() || group_size - size > tolerance) {
            groups.emplace_back();
            group_size = size;
        }
        groups.back().push_back(index);
    }
    return groups;
}

// Moves members of one same-size group by at most one level, staying in [1, ladder]
void apply_overrides(const std::vector<size_t>& group, const std::vector<Candidate>& candidates,
                     std::vector<int>& levels, int base_level, int ladder,
                     const ClassifierOptions& options) {
    int min_depth = 0;
    int max_depth = 0;
    for (size_t index : group) {
        int depth = candidates[index].numbering_depth;
        if (depth == 0) {
            continue;
        }
        min_depth = min_depth == 0 ? depth : std::min(min_depth, depth);
        max_depth = std::max(max_depth, depth);
    }

    if (min_depth != max_depth) {
        for (size_t index : group) {
            int depth = candidates[index].numbering_depth;
            if (depth == 0) {
                continue;
            }
            if (base_level > 1) {
                if (depth < max_depth) {
                    levels[index] = base_level - 1;
                }
            } else if (base_level < ladder && depth > min_depth) {
                levels[index] = base_level + 1;
            }
        }
        return;
    }

    if (base_level <= 1 || group.size() < 2) {
        return;
    }
    std::vector<float> content;
    for (size_t index : group) {
        content.push_back(candidates[index].content_score);
    }
    float middle = median(content);
    for (size_t index : group) {
        if (candidates[index].content_score - middle > options.content_promotion_margin) {
            levels[index] = base_level - 1;
        }
    }
}

} // namespace

Classification classify(std::vector<Candidate> candidates,
                        const DocumentProfile& profile,
                        const ClassifierOptions& options) {
    for (const auto& candidate : candidates) {
        if (candidate.script == Script::Unclassified) {
            throw InvariantViolation("candidate reached the classifier without a script: \"" +
                                     candidate.block.text + "\"");
        }
    }

    Classification result;
    if (candidates.empty()) {
        return result;
    }

    result.title = take_title(candidates, profile, options);
    if (candidates.empty()) {
        return result;
    }

    std::vector<Tier> tiers = build_tiers(candidates, profile, options);
    result.tier_count = static_cast<int>(tiers.size());
    int ladder = std::min(result.tier_count, kDeepestLevel);

    std::vector<int> levels(candidates.size(), kDeepestLevel);
    for (size_t t = 0; t < tiers.size(); ++t) {
        int base_level = std::min(static_cast<int>(t) + 1, kDeepestLevel);
        for (size_t index : tiers[t].members) {
            candidates[index].tier = static_cast<int>(t);
            levels[index] = base_level;
        }
        for (const auto& group : same_size_groups(tiers[t], candidates, options.equal_size_tolerance)) {
            apply_overrides(group, candidates, levels, base_level, ladder, options);
        }
    }

    for (size_t i = 0; i < candidates.size(); ++i) {
        int level = std::max(1, std::min(levels[i], ladder));
        if (level != levels[i]) {
            throw InvariantViolation("heading level escaped the tier ladder");
        }

        const Block& block = candidates[i].block;
        Heading heading;
        heading.level = static_cast<HeadingLevel>(level);
        heading.text = block.text;
        heading.page = block.page;
        heading.y = block.bbox.y0;
        heading.font_size = block.font_size;
        heading.order = block.order;
        result.headings.push_back(std::move(heading));
    }
    return result;
}

} // namespace pdf_outline
