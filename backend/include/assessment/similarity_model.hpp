#pragma once

#include <map>
#include <string>
#include <vector>

namespace panelsense {
namespace assessment {

/**
 * Sentence-embedding collaborator. similarity() returns a value in [0,1].
 */
class SemanticSimilarityModel {
public:
    virtual ~SemanticSimilarityModel() = default;

    /**
     * Similarity of each candidate to the query, in candidate order.
     * Implementations that embed in batches should override this.
     */
    virtual std::vector<double> similarities(const std::string& query,
                                             const std::vector<std::string>& candidates) const;

    virtual double similarity(const std::string& a, const std::string& b) const = 0;
    virtual std::string name() const = 0;
};

/**
 * Bag-of-words cosine over lower-cased word tokens with common English
 * stop words removed. Deterministic and dependency free.
 */
class LexicalSimilarityModel : public SemanticSimilarityModel {
public:
    double similarity(const std::string& a, const std::string& b) const override;
    std::string name() const override { return "lexical-cosine"; }

    static std::vector<std::string> tokenize(const std::string& text);

private:
    static std::map<std::string, double> termFrequencies(const std::string& text);
};

} // namespace assessment
} // namespace panelsense
