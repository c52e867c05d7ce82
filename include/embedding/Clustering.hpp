#pragma once

#include <cstddef>
#include <vector>

namespace intentcluster {

// Label of points that belong to no cluster
constexpr int kNoiseLabel = -1;

struct DbscanResult {
    std::vector<int> labels;   // per point, kNoiseLabel or cluster id 0..clusterCount-1
    std::vector<bool> core;    // per point, true for core points
    int clusterCount = 0;

    size_t noiseCount() const;
};

class Clustering {
public:
    // Cosine similarity between two vectors, 0 if either is zero or sizes differ
    static double cosineSimilarity(const std::vector<double>& a, const std::vector<double>& b);

    // 1 - cosine similarity, clamped to [0, 2]
    static double cosineDistance(const std::vector<double>& a, const std::vector<double>& b);

    // DBSCAN with cosine distance.
    // Seeds are visited in ascending index order and clusters grow breadth-first,
    // scanning neighbours in ascending index order. A border point keeps the
    // label of the first cluster that reaches it.
    // Throws InvalidParameter if eps <= 0 or minPts < 1.
    static DbscanResult dbscan(const std::vector<std::vector<double>>& points, double eps, int minPts);

    // Labels only
    static std::vector<int> cluster(const std::vector<std::vector<double>>& points, double eps, int minPts);

    static void validateParameters(double eps, int minPts);

private:
    // Indices within eps of each point, ascending. A non-zero point is always
    // its own neighbour. A zero vector is at distance 1 from every point,
    // itself included, so it has no neighbours for eps < 1 and every point,
    // itself included, is its neighbour once eps >= 1.
    static std::vector<std::vector<size_t>> regionQueries(const std::vector<std::vector<double>>& points,
                                                          double eps);
};

} // namespace intentcluster
