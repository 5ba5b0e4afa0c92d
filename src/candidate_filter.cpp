#include "pdf_outline/candidate_filter.h"
#include "pdf_outline/script_detector.h"
#include "pdf_outline/text_utils.h"
#include <algorithm>
#include <regex>

namespace pdf_outline {

const char* to_string(ExclusionReason reason) {
    switch (reason) {
        case ExclusionReason::LowScore: return "low_score";
        case ExclusionReason::TooShort: return "too_short";
        case ExclusionReason::PageNumber: return "page_number";
        case ExclusionReason::UrlOrEmail: return "url_or_email";
        case ExclusionReason::RepeatedHeaderFooter: return "repeated_header_footer";
        case ExclusionReason::Caption: return "caption";
        case ExclusionReason::Boilerplate: return "boilerplate";
        case ExclusionReason::NumericDominated: return "numeric_dominated";
        case ExclusionReason::TooLong: return "too_long";
        case ExclusionReason::Fragment: return "fragment";
    }
    return "unknown";
}

namespace {

const auto kFlags = std::regex::ECMAScript | std::regex::optimize;

// Patterns run against lower-cased text
const std::vector<std::regex>& page_number_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex("^\\d{1,4}$", kFlags),
        std::regex("^(?:-|–|—)\\s*\\d{1,4}\\s*(?:-|–|—)$", kFlags),
        std::regex("^(?:page|p\\.|pg\\.?|seite|página|pagina|страница|стр\\.)\\s*\\d{1,4}"
                   "(?:\\s*(?:of|/|von|de|di|из)\\s*\\d{1,4})?$", kFlags),
        std::regex("^\\d{1,4}\\s*(?:/|of)\\s*\\d{1,4}$", kFlags),
        std::regex("^(?=[ivxlc])c{0,3}(?:xc|xl|l?x{0,3})(?:ix|iv|v?i{0,3})$", kFlags),
        std::regex("^第\\s*\\d{1,4}\\s*(?:页|頁)(?:\\s*/\\s*共\\s*\\d{1,4}\\s*(?:页|頁))?$", kFlags),
        std::regex("^\\d{1,4}\\s*(?:页|頁|ページ|쪽|페이지)$", kFlags)};
    return patterns;
}

const std::regex& url_pattern() {
    static const std::regex pattern(
        "(?:https?://|ftp://|www\\.)\\S+|[a-z0-9._%+-]+@[a-z0-9-]+(?:\\.[a-z0-9-]+)+", kFlags);
    return pattern;
}

const std::regex& caption_pattern() {
    static const std::regex pattern(
        "^(?:figure|fig\\.|table|tab\\.|chart|diagram|exhibit|image|listing|plate|"
        "abbildung|abb\\.|tabelle|tableau|tabla|tabella|рисунок|рис\\.|таблица|"
        "图|圖|表|그림|표)\\s*\\d+", kFlags);
    return pattern;
}

const std::vector<std::string> kBoilerplate = {
    "©", "(c) 1", "(c) 2", "copyright", "all rights reserved", "tous droits réservés",
    "alle rechte vorbehalten", "todos los derechos reservados", "版权所有", "著作権",
    "isbn", "doi:"};

const std::vector<std::string> kContactPrefixes = {
    "tel:", "tel.", "fax:", "phone:", "e-mail:", "email:", "mobile:", "тел.", "тел:"};

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

bool is_currency(char32_t cp) {
    return cp == U'$' || cp == U'€' || cp == U'£' || cp == U'¥' || cp == U'₹' ||
           cp == U'₽' || cp == U'%';
}

// Ratio of digits and currency marks among visible characters, ignoring a
// leading "2.1"-style section number
float numeric_share(const std::string& text, int depth) {
    std::string body = text;
    if (depth > 0 && !body.empty() && body[0] >= '0' && body[0] <= '9') {
        size_t space = body.find(' ');
        body = space == std::string::npos ? std::string() : body.substr(space + 1);
    }
    int visible = 0;
    int numeric = 0;
    for (char32_t cp : decode_utf8(body)) {
        if (is_whitespace(cp)) {
            continue;
        }
        visible++;
        if (is_digit(cp) || is_currency(cp)) {
            numeric++;
        }
    }
    if (visible == 0) {
        return 1.0f;
    }
    return static_cast<float>(numeric) / static_cast<float>(visible);
}

bool is_fragment(const Candidate& candidate, const ScriptProfile& profile) {
    const std::string& text = candidate.block.text;
    auto code_points = decode_utf8(text);
    if (code_points.empty()) {
        return true;
    }

    // Continuation of a sentence broken across blocks
    if (profile.has_case && candidate.numbering_depth == 0 && is_lower(code_points.front())) {
        return true;
    }
    char32_t last = code_points.back();
    if (last == U',' || last == U';' || last == U'-' || last == U'、' || last == U'，') {
        return true;
    }

    if (!profile.fragment_words.empty()) {
        auto words = split_words(text);
        if (words.size() > 1) {
            std::string tail = to_lower(words.back());
            if (std::find(profile.fragment_words.begin(), profile.fragment_words.end(), tail) !=
                profile.fragment_words.end()) {
                return true;
            }
        }
    }
    return false;
}

} // namespace

std::optional<ExclusionReason> exclusion_reason(const Candidate& candidate,
                                                const DocumentProfile& profile,
                                                const FilterOptions& options) {
    const Block& block = candidate.block;
    const ScriptProfile& script = script_profile(candidate.script);

    if (block.char_count < options.min_chars) {
        return ExclusionReason::TooShort;
    }
    // Before any pattern runs on the text
    if (block.char_count > options.max_heading_chars) {
        return ExclusionReason::TooLong;
    }

    std::string lower = to_lower(block.text);
    for (const auto& pattern : page_number_patterns()) {
        if (std::regex_match(lower, pattern)) {
            return ExclusionReason::PageNumber;
        }
    }
    if (std::regex_search(lower, url_pattern())) {
        return ExclusionReason::UrlOrEmail;
    }
    if (profile.is_repeated(block)) {
        return ExclusionReason::RepeatedHeaderFooter;
    }
    if (std::regex_search(lower, caption_pattern())) {
        return ExclusionReason::Caption;
    }
    for (const auto& marker : kBoilerplate) {
        if (lower.find(marker) != std::string::npos) {
            return ExclusionReason::Boilerplate;
        }
    }
    for (const auto& prefix : kContactPrefixes) {
        if (starts_with(lower, prefix)) {
            return ExclusionReason::Boilerplate;
        }
    }
    if (numeric_share(block.text, candidate.numbering_depth) > options.numeric_ratio) {
        return ExclusionReason::NumericDominated;
    }
    if (word_count(block.text, script) > options.max_heading_words) {
        return ExclusionReason::TooLong;
    }
    if (is_fragment(candidate, script)) {
        return ExclusionReason::Fragment;
    }
    if (candidate.score < options.min_score) {
        return ExclusionReason::LowScore;
    }
    return std::nullopt;
}

std::vector<Candidate> filter_candidates(std::vector<Candidate> candidates,
                                         const DocumentProfile& profile,
                                         const FilterOptions& options) {
    auto removed = std::stable_partition(candidates.begin(), candidates.end(),
        [&](const Candidate& candidate) {
            return !exclusion_reason(candidate, profile, options).has_value();
        });
    candidates.erase(removed, candidates.end());
    return candidates;
}

} // namespace pdf_outline
