#pragma once
#include <string>
#include <vector>

namespace textutil {

std::string trim_copy(const std::string& s);

std::string to_lower_copy(std::string s);

// "critical" -> "Critical"
std::string capitalize(const std::string& s);

// "ai_readiness" -> "Ai Readiness"
std::string title_case_words(const std::string& s);

// keeps max chars, last three replaced by "..." when cut
std::string truncate(const std::string& s, size_t max);

// rounds to integer, groups thousands with ','
std::string format_thousands(double v);

// fixed decimals, "-0.0" printed as "0.0"
std::string format_fixed(double v, int decimals);

// rounded integer
std::string format_int(double v);

// collapse runs of whitespace to one space, trim ends
std::string collapse_whitespace(const std::string& s);

// malformed, overlong, surrogate and out-of-range sequences become U+FFFD
std::string sanitize_utf8(const std::string& s);

// greedy wrap on spaces; words longer than max_chars are hard-split
std::vector<std::string> word_wrap(const std::string& s, size_t max_chars);

}  // namespace textutil
