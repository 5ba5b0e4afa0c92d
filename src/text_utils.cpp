#include "pdf_outline/text_utils.h"
#include "pdf_outline/errors.h"
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>
#include <unicode/uscript.h>
#include <unicode/locid.h>

namespace pdf_outline {

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

} // namespace

std::string normalize_text(const std::string& utf8) {
    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status)) {
        throw OutlineError(std::string("ICU NFC normalizer unavailable: ") + u_errorName(status));
    }

    icu::UnicodeString source = icu::UnicodeString::fromUTF8(icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
    icu::UnicodeString normalized = nfc->normalize(source, status);
    if (U_FAILURE(status)) {
        throw OutlineError(std::string("NFC normalization failed: ") + u_errorName(status));
    }

    icu::UnicodeString collapsed;
    bool pending_space = false;
    for (int32_t i = 0; i < normalized.length(); i = normalized.moveIndex32(i, 1)) {
        UChar32 c = normalized.char32At(i);
        if (c == static_cast<UChar32>(kReplacementChar) || (u_iscntrl(c) && !u_isUWhiteSpace(c))) {
            continue;
        }
        if (u_isUWhiteSpace(c)) {
            pending_space = !collapsed.isEmpty();
            continue;
        }
        if (pending_space) {
            collapsed.append(static_cast<UChar>(0x20));
            pending_space = false;
        }
        collapsed.append(c);
    }

    std::string result;
    collapsed.toUTF8String(result);
    return result;
}

std::vector<char32_t> decode_utf8(const std::string& utf8) {
    std::vector<char32_t> code_points;
    code_points.reserve(utf8.size());

    const char* data = utf8.data();
    int32_t length = static_cast<int32_t>(utf8.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(data, i, length, c);
        if (c >= 0) {
            code_points.push_back(static_cast<char32_t>(c));
        }
    }
    return code_points;
}

std::string encode_utf8(const std::vector<char32_t>& code_points) {
    std::string result;
    result.reserve(code_points.size());
    for (char32_t cp : code_points) {
        uint8_t buffer[U8_MAX_LENGTH];
        int32_t offset = 0;
        U8_APPEND_UNSAFE(buffer, offset, static_cast<UChar32>(cp));
        result.append(reinterpret_cast<const char*>(buffer), offset);
    }
    return result;
}

size_t code_point_count(const std::string& utf8) {
    size_t count = 0;
    for (unsigned char c : utf8) {
        // Count every byte that is not a continuation byte
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string to_lower(const std::string& utf8) {
    icu::UnicodeString text = icu::UnicodeString::fromUTF8(icu::StringPiece(utf8.data(), static_cast<int32_t>(utf8.size())));
    text.toLower(icu::Locale::getRoot());
    std::string result;
    text.toUTF8String(result);
    return result;
}

bool is_whitespace(char32_t cp) { return u_isUWhiteSpace(static_cast<UChar32>(cp)); }
bool is_letter(char32_t cp) { return u_isalpha(static_cast<UChar32>(cp)); }
bool is_digit(char32_t cp) { return u_isdigit(static_cast<UChar32>(cp)); }
bool is_upper(char32_t cp) { return u_isupper(static_cast<UChar32>(cp)); }
bool is_lower(char32_t cp) { return u_islower(static_cast<UChar32>(cp)); }

bool is_unspaced(char32_t cp) {
    UChar32 c = static_cast<UChar32>(cp);
    if (u_hasBinaryProperty(c, UCHAR_IDEOGRAPHIC)) {
        return true;
    }
    UErrorCode status = U_ZERO_ERROR;
    UScriptCode script = uscript_getScript(c, &status);
    if (U_FAILURE(status)) {
        return false;
    }
    return script == USCRIPT_HIRAGANA || script == USCRIPT_KATAKANA ||
           script == USCRIPT_THAI || script == USCRIPT_HAN;
}

std::vector<std::string> split_words(const std::string& utf8) {
    std::vector<std::string> words;
    std::vector<char32_t> current;
    for (char32_t cp : decode_utf8(utf8)) {
        if (is_whitespace(cp)) {
            if (!current.empty()) {
                words.push_back(encode_utf8(current));
                current.clear();
            }
        } else {
            current.push_back(cp);
        }
    }
    if (!current.empty()) {
        words.push_back(encode_utf8(current));
    }
    return words;
}

std::string truncate_text(const std::string& utf8, size_t max_code_points) {
    auto code_points = decode_utf8(utf8);
    if (code_points.size() <= max_code_points) {
        return utf8;
    }
    code_points.resize(max_code_points);
    while (!code_points.empty() && is_whitespace(code_points.back())) {
        code_points.pop_back();
    }
    return encode_utf8(code_points) + "...";
}

CaseStats case_stats(const std::string& utf8) {
    CaseStats stats;
    bool at_word_start = true;
    bool word_counted = false;
    for (char32_t cp : decode_utf8(utf8)) {
        if (is_whitespace(cp)) {
            at_word_start = true;
            word_counted = false;
            continue;
        }
        if (is_upper(cp)) {
            stats.upper++;
        } else if (is_lower(cp)) {
            stats.lower++;
        }
        // A word starts at its first letter, so "(a)" and "1." are skipped
        if (at_word_start && is_letter(cp)) {
            if (!word_counted) {
                stats.words++;
                word_counted = true;
            }
            if (is_upper(cp)) {
                stats.capitalized_words++;
            }
            at_word_start = false;
        }
    }
    return stats;
}

} // namespace pdf_outline
