#include "util/text.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

const std::set<std::string>& stopWords() {
    static const std::set<std::string> words = {
        "a", "an", "the", "and", "or", "but", "of", "to", "in", "on", "at", "for",
        "with", "about", "from", "by", "as", "is", "are", "was", "were", "be", "been",
        "it", "its", "this", "that", "these", "those", "i", "me", "my", "you", "your",
        "we", "our", "they", "their", "he", "she", "him", "her", "them", "what", "how",
        "why", "when", "where", "who", "which", "do", "did", "does", "can", "could",
        "would", "will", "should", "have", "has", "had", "tell", "time", "so", "if",
        "there", "some", "any", "us", "give", "example", "describe", "walk", "through"};
    return words;
}

} // namespace

std::string trim(const std::string& s) {
    std::size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    std::size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::string toLower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string normalizeText(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pendingSpace = false;
    for (unsigned char c : s) {
        if (c == '\'') continue;
        if (std::isalnum(c) || c >= 0x80) {
            if (pendingSpace && !out.empty()) out += ' ';
            pendingSpace = false;
            out += static_cast<char>(std::tolower(c));
        } else {
            pendingSpace = true;
        }
    }
    return out;
}

std::vector<std::string> tokenize(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream in(normalizeText(s));
    std::string word;
    while (in >> word) tokens.push_back(word);
    return tokens;
}

std::set<std::string> contentWords(const std::string& s) {
    std::set<std::string> words;
    for (const auto& token : tokenize(s)) {
        if (token.size() < 2) continue;
        if (stopWords().count(token)) continue;
        words.insert(token);
    }
    return words;
}

double jaccard(const std::set<std::string>& a, const std::set<std::string>& b) {
    if (a.empty() && b.empty()) return 0.0;
    std::size_t common = 0;
    for (const auto& w : a) common += b.count(w);
    const std::size_t unionSize = a.size() + b.size() - common;
    return unionSize == 0 ? 0.0 : static_cast<double>(common) / static_cast<double>(unionSize);
}

void appendSentence(std::string& base, const std::string& piece) {
    const std::string clean = trim(piece);
    if (clean.empty()) return;
    if (!base.empty()) base += ' ';
    base += clean;
}
