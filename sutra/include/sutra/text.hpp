#pragma once
// Text helpers shared by extraction, keyword scoring and explanation

#include <algorithm>
#include <cctype>
#include <set>
#include <string>
#include <vector>

namespace sutra {

// Lowercase alphanumeric runs of length >= 2
inline std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            current += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else if (!current.empty()) {
            if (current.length() >= 2) {  // Skip single chars
                tokens.push_back(current);
            }
            current.clear();
        }
    }
    if (!current.empty() && current.length() >= 2) {
        tokens.push_back(current);
    }
    return tokens;
}

inline std::string lowercase(const std::string& text) {
    std::string result = text;
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

inline std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

inline const std::set<std::string>& stopwords() {
    static const std::set<std::string> words = {
        "the", "and", "with", "from", "that", "this", "for", "your", "into",
        "are", "was", "will", "can", "its", "use", "using", "used", "any",
        "all", "when", "then", "than", "them", "they", "what", "which",
        "how", "who", "a", "an", "to", "of", "in", "on", "or", "by", "is",
        "it", "be", "as", "at", "do", "me", "my", "we", "our", "you"
    };
    return words;
}

// Query terms: tokens minus stop words, order preserved, no duplicates
inline std::vector<std::string> content_terms(const std::string& text) {
    std::vector<std::string> terms;
    std::set<std::string> seen;
    for (auto& token : tokenize(text)) {
        if (stopwords().count(token)) continue;
        if (seen.insert(token).second) terms.push_back(token);
    }
    return terms;
}

// Text up to the first '.' (trimmed)
inline std::string first_sentence(const std::string& text) {
    auto dot = text.find('.');
    return trim(dot == std::string::npos ? text : text.substr(0, dot));
}

// "Workflow Control" -> "workflow-control", "AI/ML" -> "ai-ml"
inline std::string slugify(const std::string& text) {
    std::string slug;
    bool dash = false;
    for (char c : lowercase(trim(text))) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            slug += c;
            dash = false;
        } else if (!slug.empty() && !dash) {
            slug += '-';
            dash = true;
        }
    }
    while (!slug.empty() && slug.back() == '-') slug.pop_back();
    return slug;
}

// Last dotted segment of an id, lowercased: "n8n-nodes-base.slack" -> "slack"
inline std::string node_key(const std::string& id) {
    auto dot = id.find_last_of('.');
    return lowercase(dot == std::string::npos ? id : id.substr(dot + 1));
}

inline size_t word_count(const std::string& text) {
    size_t count = 0;
    bool in_word = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++count;
        }
    }
    return count;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

} // namespace sutra
