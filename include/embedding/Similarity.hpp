#pragma once

#include <vector>
#include "embedding/Vectorizer.hpp"

namespace intentcluster {

// Dense N x N cosine similarities, symmetric
using SimilarityMatrix = std::vector<std::vector<double>>;

class SimilarityEngine {
public:
    // Pairwise cosine similarity of L2-normalized sparse vectors.
    // Any pair involving a zero vector scores 0, the diagonal included.
    static SimilarityMatrix compute(const std::vector<FeatureVector>& vectors);

    // Merge-join dot product over two column-sorted sparse vectors
    static double dotSparse(const FeatureVector& a, const FeatureVector& b);
};

} // namespace intentcluster
