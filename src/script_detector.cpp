#include "pdf_outline/script_detector.h"
#include "pdf_outline/errors.h"
#include "pdf_outline/text_utils.h"
#include <unicode/uscript.h>
#include <array>
#include <cmath>
#include <map>

namespace pdf_outline {

const char* to_string(Script script) {
    switch (script) {
        case Script::Unclassified: return "Unclassified";
        case Script::Latin: return "Latin";
        case Script::Cyrillic: return "Cyrillic";
        case Script::Greek: return "Greek";
        case Script::Arabic: return "Arabic";
        case Script::Hebrew: return "Hebrew";
        case Script::Devanagari: return "Devanagari";
        case Script::Cjk: return "Cjk";
        case Script::Hangul: return "Hangul";
        case Script::Thai: return "Thai";
        case Script::Other: return "Other";
    }
    return "Unknown";
}

namespace {

constexpr size_t kScriptCount = static_cast<size_t>(Script::Other) + 1;

Script from_icu(UScriptCode code) {
    switch (code) {
        case USCRIPT_LATIN: return Script::Latin;
        case USCRIPT_CYRILLIC: return Script::Cyrillic;
        case USCRIPT_GREEK: return Script::Greek;
        case USCRIPT_ARABIC: return Script::Arabic;
        case USCRIPT_HEBREW: return Script::Hebrew;
        case USCRIPT_DEVANAGARI: return Script::Devanagari;
        case USCRIPT_HAN:
        case USCRIPT_HIRAGANA:
        case USCRIPT_KATAKANA:
        case USCRIPT_BOPOMOFO:
            return Script::Cjk;
        case USCRIPT_HANGUL: return Script::Hangul;
        case USCRIPT_THAI: return Script::Thai;
        case USCRIPT_COMMON:
        case USCRIPT_INHERITED:
        case USCRIPT_UNKNOWN:
            return Script::Unclassified;
        default:
            return Script::Other;
    }
}

const std::vector<std::string> kLatinTerminators = {".", "!", "?", "…"};
const std::vector<std::string> kLatinClauses = {",", ";"};

std::map<Script, ScriptProfile> build_profiles() {
    std::map<Script, ScriptProfile> profiles;
    const auto flags = std::regex::ECMAScript | std::regex::optimize;

    ScriptProfile latin;
    latin.script = Script::Latin;
    latin.keywords = {
        // English
        "chapter", "section", "part", "appendix", "annex", "introduction", "conclusion",
        "conclusions", "summary", "abstract", "overview", "background", "methodology",
        "methods", "results", "discussion", "references", "bibliography", "acknowledgements",
        "acknowledgments", "table of contents", "contents", "preface", "foreword", "glossary",
        "objectives", "scope", "requirements", "revision history",
        // French, German, Spanish, Portuguese, Italian, Dutch, Polish, Turkish, Vietnamese
        "chapitre", "annexe", "sommaire", "kapitel", "abschnitt", "einleitung",
        "zusammenfassung", "anhang", "inhaltsverzeichnis", "capítulo", "sección", "introducción",
        "conclusión", "resumen", "introdução", "conclusão", "capitolo", "sezione",
        "introduzione", "hoofdstuk", "inleiding", "rozdział", "wstęp", "bölüm", "giriş",
        "chương", "phần"};
    latin.numbering = std::regex(
        "^(?:chapter|section|part|appendix|article|chapitre|partie|kapitel|abschnitt|teil|"
        "capítulo|sección|parte|capitolo|sezione|hoofdstuk|rozdział|bölüm|chương)\\s+"
        "(\\d{1,3}(?:\\.\\d{1,3})*|[ivxlc]{1,6}|[a-z])(?:[.:)]|\\s|$)", flags);
    latin.sentence_terminators = kLatinTerminators;
    latin.clause_marks = kLatinClauses;
    latin.fragment_words = {"and", "or", "the", "of", "in", "on", "at", "to", "for",
                            "a", "an", "with", "by", "from", "but"};
    profiles.emplace(Script::Latin, latin);

    ScriptProfile cyrillic;
    cyrillic.script = Script::Cyrillic;
    cyrillic.keywords = {"глава", "раздел", "часть", "приложение", "введение", "заключение",
                         "содержание", "оглавление", "выводы", "аннотация", "розділ", "вступ",
                         "висновки", "поглавје", "увод"};
    cyrillic.numbering = std::regex(
        "^(?:глава|раздел|часть|приложение|розділ|частина)\\s+"
        "(\\d{1,3}(?:\\.\\d{1,3})*|[ivxlc]{1,6})(?:[.:)]|\\s|$)", flags);
    cyrillic.sentence_terminators = kLatinTerminators;
    cyrillic.clause_marks = kLatinClauses;
    cyrillic.fragment_words = {"и", "или", "в", "на", "с", "к", "для", "по", "из", "о"};
    profiles.emplace(Script::Cyrillic, cyrillic);

    ScriptProfile greek;
    greek.script = Script::Greek;
    greek.keywords = {"κεφάλαιο", "ενότητα", "μέρος", "παράρτημα", "εισαγωγή", "συμπεράσματα",
                      "συμπέρασμα", "περίληψη", "περιεχόμενα"};
    greek.numbering = std::regex(
        "^(?:κεφάλαιο|ενότητα|μέρος)\\s+(\\d{1,3}(?:\\.\\d{1,3})*)(?:[.:)]|\\s|$)", flags);
    greek.sentence_terminators = {".", "!", "…"};
    greek.clause_marks = {",", "·"};
    greek.fragment_words = {"και", "ή", "του", "της", "το", "των", "σε"};
    profiles.emplace(Script::Greek, greek);

    ScriptProfile arabic;
    arabic.script = Script::Arabic;
    arabic.has_case = false;
    arabic.keywords = {"الفصل", "الباب", "القسم", "الجزء", "مقدمة", "المقدمة", "الخاتمة",
                       "خاتمة", "ملخص", "الملخص", "الملحق", "المحتويات", "فهرس"};
    arabic.numbering = std::regex(
        "^(?:الفصل|الباب|القسم|الجزء)\\s*(\\d{1,3}(?:\\.\\d{1,3})*)?(?:\\s|:|$)", flags);
    arabic.sentence_terminators = {".", "!", "؟", "۔"};
    arabic.clause_marks = {"،", "؛", ","};
    profiles.emplace(Script::Arabic, arabic);

    ScriptProfile hebrew;
    hebrew.script = Script::Hebrew;
    hebrew.has_case = false;
    hebrew.keywords = {"פרק", "חלק", "סעיף", "נספח", "מבוא", "סיכום", "תוכן העניינים"};
    hebrew.numbering = std::regex("^(?:פרק|חלק|סעיף)\\s*(\\d{1,3}(?:\\.\\d{1,3})*)?(?:\\s|:|$)", flags);
    hebrew.sentence_terminators = kLatinTerminators;
    hebrew.clause_marks = kLatinClauses;
    profiles.emplace(Script::Hebrew, hebrew);

    ScriptProfile devanagari;
    devanagari.script = Script::Devanagari;
    devanagari.has_case = false;
    devanagari.keywords = {"अध्याय", "भाग", "खंड", "परिचय", "प्रस्तावना", "निष्कर्ष", "सारांश",
                           "अनुक्रमणिका", "परिशिष्ट"};
    devanagari.numbering = std::regex(
        "^(?:अध्याय|भाग|खंड)\\s*((?:\\d|०|१|२|३|४|५|६|७|८|९){1,3})(?:[.:)]|\\s|$)", flags);
    devanagari.sentence_terminators = {"।", "॥", ".", "!", "?"};
    devanagari.clause_marks = kLatinClauses;
    profiles.emplace(Script::Devanagari, devanagari);

    ScriptProfile cjk;
    cjk.script = Script::Cjk;
    cjk.has_case = false;
    cjk.space_delimited = false;
    cjk.chars_per_word = 2.0f;
    cjk.keywords = {"目录", "目次", "序言", "前言", "引言", "概要", "摘要", "结论", "結論",
                    "总结", "參考文獻", "参考文献", "附录", "附錄", "付録", "はじめに", "まとめ",
                    "序論", "緒言", "おわりに"};
    cjk.numbering = std::regex(
        "^第\\s*((?:\\d|一|二|三|四|五|六|七|八|九|十|百|〇|零)+)\\s*"
        "(?:章|节|節|部|篇|条|條|回|編)", flags);
    cjk.sentence_terminators = {"。", "！", "？", ".", "．", "!", "?"};
    cjk.clause_marks = {"，", "、", "；", ",", ";"};
    profiles.emplace(Script::Cjk, cjk);

    ScriptProfile hangul;
    hangul.script = Script::Hangul;
    hangul.has_case = false;
    hangul.keywords = {"서론", "결론", "요약", "목차", "부록", "개요", "참고문헌", "머리말"};
    hangul.numbering = std::regex("^제\\s*(\\d{1,3})\\s*(?:장|절|편|부|조)", flags);
    hangul.sentence_terminators = {".", "!", "?", "。"};
    hangul.clause_marks = kLatinClauses;
    profiles.emplace(Script::Hangul, hangul);

    ScriptProfile thai;
    thai.script = Script::Thai;
    thai.has_case = false;
    thai.space_delimited = false;
    thai.chars_per_word = 5.0f;
    thai.keywords = {"บทที่", "ภาคผนวก", "บทนำ", "สรุป", "สารบัญ", "บทคัดย่อ"};
    thai.numbering = std::regex("^บทที่\\s*((?:\\d|๐|๑|๒|๓|๔|๕|๖|๗|๘|๙){1,3})", flags);
    thai.sentence_terminators = {".", "!", "?"};
    thai.clause_marks = {","};
    profiles.emplace(Script::Thai, thai);

    ScriptProfile other;
    other.script = Script::Other;
    other.has_case = false;
    other.numbering = std::regex("(?!)", flags);
    other.sentence_terminators = kLatinTerminators;
    other.clause_marks = kLatinClauses;
    profiles.emplace(Script::Other, other);

    return profiles;
}

int count_number_groups(const std::string& number) {
    auto code_points = decode_utf8(number);
    int groups = 0;
    bool in_group = false;
    for (char32_t cp : code_points) {
        bool separator = cp == U'.' || cp == U'．';
        if (separator) {
            in_group = false;
        } else if (!in_group) {
            in_group = true;
            groups++;
        }
    }
    return groups;
}

} // namespace

Script detect_script(const std::string& utf8) {
    std::array<int, kScriptCount> votes{};
    for (char32_t cp : decode_utf8(utf8)) {
        UErrorCode status = U_ZERO_ERROR;
        UScriptCode code = uscript_getScript(static_cast<UChar32>(cp), &status);
        if (U_FAILURE(status)) {
            continue;
        }
        Script script = from_icu(code);
        if (script != Script::Unclassified) {
            votes[static_cast<size_t>(script)]++;
        }
    }

    Script best = Script::Latin;
    int best_votes = 0;
    for (size_t i = 0; i < kScriptCount; ++i) {
        if (votes[i] > best_votes) {
            best_votes = votes[i];
            best = static_cast<Script>(i);
        }
    }
    return best;
}

const ScriptProfile& script_profile(Script script) {
    static const std::map<Script, ScriptProfile> profiles = build_profiles();
    auto it = profiles.find(script);
    if (it == profiles.end()) {
        throw InvariantViolation(std::string("no script profile for ") + to_string(script));
    }
    return it->second;
}

int numbering_depth(const std::string& text, const ScriptProfile& profile) {
    static const std::regex decimal(
        "^(\\d{1,3}(?:(?:\\.|．)\\d{1,3})*)(?:\\.|．|\\)|:)?(?:\\s|$)");
    static const std::regex lettered("^([a-z](?:\\.\\d{1,3})+)(?:\\.|\\))?(?:\\s|$)");
    static const std::regex enumerated("^(?:[ivxlc]{1,6}|[a-z])(?:\\.|\\))\\s");

    std::string lower = to_lower(text);
    std::smatch match;
    if (std::regex_search(lower, match, decimal)) {
        return count_number_groups(match[1].str());
    }
    if (std::regex_search(lower, match, lettered)) {
        return count_number_groups(match[1].str());
    }
    if (std::regex_search(lower, match, enumerated)) {
        return 1;
    }
    if (std::regex_search(lower, match, profile.numbering)) {
        if (match.size() > 1 && match[1].matched) {
            return std::max(1, count_number_groups(match[1].str()));
        }
        return 1;
    }
    return 0;
}

bool starts_with_keyword(const std::string& text, const ScriptProfile& profile) {
    std::string lower = to_lower(text);
    for (const auto& keyword : profile.keywords) {
        if (lower.compare(0, keyword.size(), keyword) != 0) {
            continue;
        }
        if (!profile.space_delimited || lower.size() == keyword.size()) {
            return true;
        }
        // Whole word: the keyword must be followed by a non-letter
        auto rest = decode_utf8(lower.substr(keyword.size(), 4));
        if (!rest.empty() && !is_letter(rest.front())) {
            return true;
        }
    }
    return false;
}

int word_count(const std::string& text, const ScriptProfile& profile) {
    if (profile.space_delimited) {
        return static_cast<int>(split_words(text).size());
    }
    int letters = 0;
    for (char32_t cp : decode_utf8(text)) {
        if (!is_whitespace(cp)) {
            letters++;
        }
    }
    return static_cast<int>(std::ceil(letters / profile.chars_per_word));
}

bool ends_with_any(const std::string& text, const std::vector<std::string>& suffixes) {
    for (const auto& suffix : suffixes) {
        if (text.size() >= suffix.size() &&
            text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return true;
        }
    }
    return false;
}

int count_occurrences(const std::string& text, const std::vector<std::string>& marks) {
    int count = 0;
    for (const auto& mark : marks) {
        for (size_t pos = text.find(mark); pos != std::string::npos; pos = text.find(mark, pos + mark.size())) {
            count++;
        }
    }
    return count;
}

} // namespace pdf_outline
