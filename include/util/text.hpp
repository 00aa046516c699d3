#ifndef TEXT_HPP
#define TEXT_HPP

#include <set>
#include <string>
#include <vector>

std::string trim(const std::string& s);
std::string toLower(const std::string& s);

// Lowercases, replaces punctuation with spaces and collapses whitespace.
std::string normalizeText(const std::string& s);

// Words of normalizeText(s), in order. Apostrophes are dropped ("what's" -> "whats").
std::vector<std::string> tokenize(const std::string& s);

// Tokens with common English stop words removed.
std::set<std::string> contentWords(const std::string& s);

// |a ∩ b| / |a ∪ b|, 0 when both are empty.
double jaccard(const std::set<std::string>& a, const std::set<std::string>& b);

// Appends `piece` to `base` with a single separating space.
void appendSentence(std::string& base, const std::string& piece);

#endif
