#include "assessment/similarity_model.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_set>

namespace panelsense {
namespace assessment {

namespace {

const std::unordered_set<std::string>& stopWords() {
    static const std::unordered_set<std::string> words = {
        "a", "an", "and", "are", "as", "at", "be", "but", "by", "did", "do", "for", "from",
        "had", "has", "have", "he", "her", "his", "i", "in", "is", "it", "its", "me", "my",
        "of", "on", "or", "our", "she", "so", "that", "the", "their", "them", "then", "there",
        "they", "this", "to", "was", "we", "were", "what", "when", "which", "who", "with",
        "you", "your"
    };
    return words;
}

} // namespace

std::vector<double> SemanticSimilarityModel::similarities(const std::string& query,
                                                          const std::vector<std::string>& candidates) const {
    std::vector<double> result;
    result.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        result.push_back(similarity(query, candidate));
    }
    return result;
}

std::vector<std::string> LexicalSimilarityModel::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    auto flush = [&]() {
        if (!current.empty() && stopWords().count(current) == 0) {
            tokens.push_back(current);
        }
        current.clear();
    };

    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (c >= 0x80) {
            // keep UTF-8 sequences inside words
            current.push_back(static_cast<char>(c));
        } else {
            flush();
        }
    }
    flush();
    return tokens;
}

std::map<std::string, double> LexicalSimilarityModel::termFrequencies(const std::string& text) {
    std::map<std::string, double> tf;
    for (const auto& token : tokenize(text)) {
        tf[token] += 1.0;
    }
    return tf;
}

double LexicalSimilarityModel::similarity(const std::string& a, const std::string& b) const {
    auto left = termFrequencies(a);
    auto right = termFrequencies(b);
    if (left.empty() || right.empty()) {
        return 0.0;
    }

    double dot = 0.0;
    for (const auto& entry : left) {
        auto it = right.find(entry.first);
        if (it != right.end()) {
            dot += entry.second * it->second;
        }
    }

    double normLeft = 0.0;
    double normRight = 0.0;
    for (const auto& entry : left) {
        normLeft += entry.second * entry.second;
    }
    for (const auto& entry : right) {
        normRight += entry.second * entry.second;
    }

    double cosine = dot / (std::sqrt(normLeft) * std::sqrt(normRight));
    return std::clamp(cosine, 0.0, 1.0);
}

} // namespace assessment
} // namespace panelsense
