#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pdf_outline {

// NFC-normalizes UTF-8 text, collapses every run of Unicode whitespace into a
// single ASCII space and strips both ends. Invalid UTF-8 bytes are dropped.
std::string normalize_text(const std::string& utf8);

std::vector<char32_t> decode_utf8(const std::string& utf8);
std::string encode_utf8(const std::vector<char32_t>& code_points);

size_t code_point_count(const std::string& utf8);

// Locale-independent (root locale) lower-casing
std::string to_lower(const std::string& utf8);

bool is_whitespace(char32_t cp);
bool is_letter(char32_t cp);
bool is_digit(char32_t cp);
bool is_upper(char32_t cp);
bool is_lower(char32_t cp);

// Ideographs, kana and Thai: scripts written without spaces between words
bool is_unspaced(char32_t cp);

std::vector<std::string> split_words(const std::string& utf8);

// Cuts to at most max_code_points, appending "..." when anything was removed
std::string truncate_text(const std::string& utf8, size_t max_code_points);

struct CaseStats {
    int upper = 0;
    int lower = 0;
    int words = 0;
    int capitalized_words = 0;
};

CaseStats case_stats(const std::string& utf8);

} // namespace pdf_outline
