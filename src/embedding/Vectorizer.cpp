#include "embedding/Vectorizer.hpp"
#include <cmath>
#include <map>
#include <stdexcept>
#include <unordered_set>

namespace intentcluster {

int64_t Vocabulary::indexOf(const std::string& term) const {
    auto it = index_.find(term);
    return it != index_.end() ? static_cast<int64_t>(it->second) : -1;
}

Vocabulary TfidfVectorizer::fit(const std::vector<nlp::TokenSequence>& sequences) {
    Vocabulary vocab;
    vocab.documents_ = sequences.size();

    for (const auto& sequence : sequences) {
        // Each document counts once per distinct term
        std::unordered_set<uint32_t> seenInDocument;

        for (const auto& token : sequence) {
            auto [it, inserted] = vocab.index_.emplace(token, static_cast<uint32_t>(vocab.terms_.size()));
            if (inserted) {
                vocab.terms_.push_back(token);
                vocab.df_.push_back(0);
            }
            if (seenInDocument.insert(it->second).second) {
                vocab.df_[it->second]++;
            }
        }
    }

    const double n = static_cast<double>(vocab.documents_);
    vocab.idf_.reserve(vocab.df_.size());
    for (uint32_t df : vocab.df_) {
        vocab.idf_.push_back(std::log((1.0 + n) / (1.0 + static_cast<double>(df))) + 1.0);
    }

    return vocab;
}

FeatureVector TfidfVectorizer::transformOne(const Vocabulary& vocabulary, const nlp::TokenSequence& sequence) {
    // Ordered map keeps the columns sorted
    std::map<uint32_t, double> termFrequency;
    for (const auto& token : sequence) {
        int64_t column = vocabulary.indexOf(token);
        if (column < 0) continue;
        termFrequency[static_cast<uint32_t>(column)] += 1.0;
    }

    FeatureVector vector;
    vector.reserve(termFrequency.size());
    double sumSquares = 0.0;

    for (const auto& [column, tf] : termFrequency) {
        double weight = tf * vocabulary.idf(column);
        vector.emplace_back(column, weight);
        sumSquares += weight * weight;
    }

    if (sumSquares == 0.0) {
        return {};
    }

    const double length = std::sqrt(sumSquares);
    for (auto& entry : vector) {
        entry.second /= length;
    }

    return vector;
}

std::vector<FeatureVector> TfidfVectorizer::transform(const Vocabulary& vocabulary,
                                                      const std::vector<nlp::TokenSequence>& sequences) {
    std::vector<FeatureVector> vectors;
    vectors.reserve(sequences.size());
    for (const auto& sequence : sequences) {
        vectors.push_back(transformOne(vocabulary, sequence));
    }
    return vectors;
}

VectorizedBatch TfidfVectorizer::fitTransform(const std::vector<nlp::TokenSequence>& sequences) {
    VectorizedBatch batch;
    batch.vocabulary = fit(sequences);
    batch.vectors = transform(batch.vocabulary, sequences);
    return batch;
}

std::vector<double> TfidfVectorizer::toDense(const FeatureVector& vector, size_t dimension) {
    std::vector<double> dense(dimension, 0.0);
    for (const auto& [column, weight] : vector) {
        if (column >= dimension) {
            throw std::out_of_range("Feature column " + std::to_string(column) +
                                    " outside dimension " + std::to_string(dimension));
        }
        dense[column] = weight;
    }
    return dense;
}

double TfidfVectorizer::norm(const FeatureVector& vector) {
    double sumSquares = 0.0;
    for (const auto& entry : vector) {
        sumSquares += entry.second * entry.second;
    }
    return std::sqrt(sumSquares);
}

} // namespace intentcluster
