#include "pdf_outline/feature_scorer.h"
#include "pdf_outline/script_detector.h"
#include "pdf_outline/text_utils.h"
#include <algorithm>
#include <cmath>
#include <set>

namespace pdf_outline {

namespace {

float clamp01(float value) {
    return std::min(1.0f, std::max(0.0f, value));
}

} // namespace

float DocumentProfile::share_of(const std::string& font_name) const {
    auto it = font_share.find(font_name);
    return it == font_share.end() ? 0.0f : it->second;
}

bool DocumentProfile::is_repeated(const Block& block) const {
    auto it = repeated_positions.find(block.text);
    if (it == repeated_positions.end()) {
        return false;
    }
    for (float y : it->second) {
        if (std::fabs(y - block.bbox.y0) <= repeat_tolerance) {
            return true;
        }
    }
    return false;
}

float weighted_percentile(std::vector<std::pair<float, size_t>> samples, float percentile) {
    if (samples.empty()) {
        return 0.0f;
    }
    std::sort(samples.begin(), samples.end());

    size_t total = 0;
    for (const auto& sample : samples) {
        total += sample.second;
    }
    double target = std::max(1.0, total * static_cast<double>(percentile) / 100.0);
    size_t cumulative = 0;
    for (const auto& [size, weight] : samples) {
        cumulative += weight;
        if (cumulative >= target) {
            return size;
        }
    }
    return samples.back().first;
}

DocumentProfile build_document_profile(const std::vector<std::vector<Block>>& pages,
                                       const ProfileOptions& options) {
    DocumentProfile profile;
    profile.repeat_tolerance = options.repeat_tolerance;

    std::vector<std::pair<float, size_t>> sizes;
    std::map<std::string, int> font_blocks;
    std::map<std::string, std::vector<std::pair<int, float>>> occurrences;
    bool first = true;

    for (const auto& page : pages) {
        if (page.empty()) {
            continue;
        }
        profile.page_count++;
        if (first || page.front().page < profile.first_page) {
            profile.first_page = page.front().page;
            first = false;
        }
        for (const auto& block : page) {
            sizes.emplace_back(block.font_size, static_cast<size_t>(std::max(1, block.char_count)));
            font_blocks[block.font_name]++;
            occurrences[block.text].emplace_back(block.page, block.bbox.y0);
            profile.block_count++;
        }
    }

    profile.body_size = weighted_percentile(sizes, 50.0f);
    profile.p75 = weighted_percentile(sizes, 75.0f);
    profile.p90 = weighted_percentile(sizes, 90.0f);
    profile.p95 = weighted_percentile(sizes, 95.0f);

    for (const auto& [name, count] : font_blocks) {
        profile.font_share[name] = static_cast<float>(count) / static_cast<float>(profile.block_count);
    }

    for (const auto& [text, positions] : occurrences) {
        if (static_cast<int>(positions.size()) < options.min_repeat_pages) {
            continue;
        }
        for (const auto& anchor : positions) {
            std::set<int> pages_at_position;
            for (const auto& other : positions) {
                if (std::fabs(other.second - anchor.second) <= options.repeat_tolerance) {
                    pages_at_position.insert(other.first);
                }
            }
            if (static_cast<int>(pages_at_position.size()) >= options.min_repeat_pages) {
                profile.repeated_positions[text].push_back(anchor.second);
            }
        }
    }

    return profile;
}

float font_score(const Block& block, const DocumentProfile& profile, const ScoringOptions& options) {
    float body = profile.body_size > 0.0f ? profile.body_size : block.font_size;
    float ratio = body > 0.0f ? block.font_size / body : 1.0f;
    float size_part = clamp01((ratio - 1.0f) / options.size_ratio_span);

    float score = 0.65f * size_part;
    if (block.bold) {
        score += 0.25f;
    }
    if (block.italic) {
        score += 0.05f;
    }
    if (profile.block_count > 0 && profile.share_of(block.font_name) < options.rare_font_share) {
        score += 0.10f;
    }
    // Blocks mixing sizes are usually running text with inline emphasis
    if (block.size_spread > 0.5f && block.font_size > 0.0f) {
        score -= std::min(0.3f, block.size_spread / block.font_size);
    }
    return clamp01(score);
}

float content_score(const Block& block, Script script, const ScoringOptions& options) {
    const ScriptProfile& profile = script_profile(script);
    const std::string& text = block.text;

    float score = 0.0f;
    int depth = numbering_depth(text, profile);
    if (depth > 0 || starts_with_keyword(text, profile)) {
        score += 0.35f;
    }
    if (!ends_with_any(text, profile.sentence_terminators)) {
        score += 0.20f;
    }

    int words = word_count(text, profile);
    if (words <= options.short_words) {
        score += 0.25f;
    } else if (words <= options.max_heading_words) {
        score += 0.15f;
    }

    if (profile.has_case) {
        CaseStats stats = case_stats(text);
        if (stats.upper >= 2 && stats.lower == 0) {
            score += 0.15f;
        } else if (stats.words > 0 && stats.capitalized_words * 2 >= stats.words) {
            score += 0.15f;
        } else if (stats.capitalized_words > 0) {
            score += 0.05f;
        }
    }

    // Sentence structure
    if (count_occurrences(text, profile.clause_marks) >= 2) {
        score -= 0.20f;
    }
    int terminators = count_occurrences(text, profile.sentence_terminators);
    if (terminators >= 2 || (terminators == 1 && !ends_with_any(text, profile.sentence_terminators) && depth == 0)) {
        score -= 0.15f;
    }
    if (block.char_count > options.long_chars) {
        score -= 0.30f;
    }
    if (words > options.long_words) {
        score -= 0.20f;
    }
    return clamp01(score);
}

float layout_score(const Block& block, Script script, const DocumentProfile& profile,
                   const ScoringOptions& options) {
    float body = profile.body_size > 0.0f ? profile.body_size : block.font_size;
    if (body <= 0.0f) {
        return 0.0f;
    }

    float score = 0.0f;
    if (block.centered) {
        score += 0.35f;
    }

    float above = block.space_above / body;
    if (above >= options.wide_space_above) {
        score += 0.25f;
    } else if (above >= options.space_above) {
        score += 0.15f;
    }
    float below = block.space_below / body;
    if (below >= options.space_below) {
        score += 0.15f;
    } else if (below >= options.narrow_space_below) {
        score += 0.05f;
    }

    if (block.line_count <= 2) {
        score += 0.10f;
    }

    // Section numbers sit on the margin, or indent one step per level
    int depth = numbering_depth(block.text, script_profile(script));
    if (depth > 0) {
        if (block.indent <= 3.0f) {
            score += 0.15f;
        } else if (block.indent <= depth * 2.0f * body) {
            score += 0.10f;
        }
    }
    return clamp01(score);
}

Candidate score_block(const Block& block, const DocumentProfile& profile, const ScoringOptions& options) {
    Candidate candidate;
    candidate.block = block;
    candidate.script = detect_script(block.text);
    candidate.numbering_depth = numbering_depth(block.text, script_profile(candidate.script));
    candidate.font_score = font_score(block, profile, options);
    candidate.content_score = content_score(block, candidate.script, options);
    candidate.layout_score = layout_score(block, candidate.script, profile, options);
    candidate.score = clamp01(options.font_weight * candidate.font_score +
                              options.content_weight * candidate.content_score +
                              options.layout_weight * candidate.layout_score);
    return candidate;
}

} // namespace pdf_outline
