#pragma once

#include <regex>
#include <string>
#include <vector>
#include "pdf_outline/types.h"

namespace pdf_outline {

// Script-specific heading conventions. One immutable profile exists per
// Script; blocks look theirs up once with script_profile().
struct ScriptProfile {
    Script script = Script::Latin;
    bool has_case = true;            // capitalization is a heading signal
    bool space_delimited = true;     // words are separated by spaces
    float chars_per_word = 1.0f;     // word estimate for unsegmented scripts
    std::vector<std::string> keywords;             // lower-case heading markers
    std::regex numbering;                          // script-specific, group 1 = number
    std::vector<std::string> sentence_terminators;
    std::vector<std::string> clause_marks;
    std::vector<std::string> fragment_words;       // words a heading never ends with
};

// Majority vote over the code points' Unicode scripts. Digits, punctuation
// and combining marks do not vote; text without any voter is Latin.
Script detect_script(const std::string& utf8);

// Throws InvariantViolation for Script::Unclassified
const ScriptProfile& script_profile(Script script);

// Number of numeric groups in a leading section number: "2." -> 1,
// "2.1" -> 2, "Chapter 4" -> 1, "第3章" -> 1, unnumbered -> 0
int numbering_depth(const std::string& text, const ScriptProfile& profile);

// Heading keyword at the start of the text ("Chapter", "Введение", "目录")
bool starts_with_keyword(const std::string& text, const ScriptProfile& profile);

// Estimated word count, using chars_per_word for unsegmented scripts
int word_count(const std::string& text, const ScriptProfile& profile);

bool ends_with_any(const std::string& text, const std::vector<std::string>& suffixes);
int count_occurrences(const std::string& text, const std::vector<std::string>& marks);

} // namespace pdf_outline
