#include "embedding/Similarity.hpp"

namespace intentcluster {

double SimilarityEngine::dotSparse(const FeatureVector& a, const FeatureVector& b) {
    double dot = 0.0;
    size_t i = 0;
    size_t j = 0;

    while (i < a.size() && j < b.size()) {
        if (a[i].first == b[j].first) {
            dot += a[i].second * b[j].second;
            ++i;
            ++j;
        } else if (a[i].first < b[j].first) {
            ++i;
        } else {
            ++j;
        }
    }

    return dot;
}

SimilarityMatrix SimilarityEngine::compute(const std::vector<FeatureVector>& vectors) {
    const size_t n = vectors.size();
    SimilarityMatrix sim(n, std::vector<double>(n, 0.0));

    // Norms are 1 or 0 after vectorization, so cosine reduces to the dot product
    std::vector<double> norms(n, 0.0);
    for (size_t i = 0; i < n; ++i) {
        norms[i] = TfidfVectorizer::norm(vectors[i]);
    }

    // O(n^2) over the upper triangle, mirrored
    for (size_t i = 0; i < n; ++i) {
        if (norms[i] == 0.0) continue;

        sim[i][i] = 1.0;
        for (size_t j = i + 1; j < n; ++j) {
            if (norms[j] == 0.0) continue;

            double value = dotSparse(vectors[i], vectors[j]) / (norms[i] * norms[j]);
            sim[i][j] = value;
            sim[j][i] = value;
        }
    }

    return sim;
}

} // namespace intentcluster
