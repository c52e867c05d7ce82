#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "nlp/TextNormalizer.hpp"

namespace intentcluster {

// Sparse L2-normalized TF-IDF row: (column, weight) pairs sorted by column.
// An empty vector is the zero vector.
using FeatureVector = std::vector<std::pair<uint32_t, double>>;

/**
 * Fitted vocabulary: term -> column in first-seen order, with document
 * frequencies and smoothed IDF weights. Immutable once built by
 * TfidfVectorizer::fit.
 */
class Vocabulary {
public:
    size_t size() const { return terms_.size(); }
    bool empty() const { return terms_.empty(); }

    // Number of token sequences the vocabulary was fitted on
    size_t documentCount() const { return documents_; }

    // Column of a term, -1 if the term was never seen
    int64_t indexOf(const std::string& term) const;

    const std::string& term(uint32_t index) const { return terms_.at(index); }
    uint32_t documentFrequency(uint32_t index) const { return df_.at(index); }
    double idf(uint32_t index) const { return idf_.at(index); }

    const std::vector<std::string>& terms() const { return terms_; }

private:
    friend class TfidfVectorizer;

    std::vector<std::string> terms_;   // column -> term
    std::vector<uint32_t> df_;         // column -> document frequency
    std::vector<double> idf_;          // column -> ln((1 + N) / (1 + df)) + 1
    std::unordered_map<std::string, uint32_t> index_;
    size_t documents_ = 0;
};

struct VectorizedBatch {
    Vocabulary vocabulary;
    std::vector<FeatureVector> vectors;
};

class TfidfVectorizer {
public:
    static Vocabulary fit(const std::vector<nlp::TokenSequence>& sequences);

    // Terms missing from the vocabulary contribute no weight
    static std::vector<FeatureVector> transform(const Vocabulary& vocabulary,
                                                const std::vector<nlp::TokenSequence>& sequences);
    static FeatureVector transformOne(const Vocabulary& vocabulary, const nlp::TokenSequence& sequence);

    static VectorizedBatch fitTransform(const std::vector<nlp::TokenSequence>& sequences);

    // Dense row of length vocabulary.size()
    static std::vector<double> toDense(const FeatureVector& vector, size_t dimension);

    static double norm(const FeatureVector& vector);
};

} // namespace intentcluster
