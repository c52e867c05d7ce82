#include "embedding/Clustering.hpp"
#include "core/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <queue>
#include <string>

namespace intentcluster {

size_t DbscanResult::noiseCount() const {
    return static_cast<size_t>(std::count(labels.begin(), labels.end(), kNoiseLabel));
}

double Clustering::cosineSimilarity(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }

    double dotProduct = 0.0;
    double normA = 0.0;
    double normB = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        dotProduct += a[i] * b[i];
        normA += a[i] * a[i];
        normB += b[i] * b[i];
    }

    if (normA == 0.0 || normB == 0.0) {
        return 0.0;
    }

    return dotProduct / (std::sqrt(normA) * std::sqrt(normB));
}

double Clustering::cosineDistance(const std::vector<double>& a, const std::vector<double>& b) {
    double distance = 1.0 - cosineSimilarity(a, b);
    return std::clamp(distance, 0.0, 2.0);
}

void Clustering::validateParameters(double eps, int minPts) {
    if (!std::isfinite(eps) || eps <= 0.0) {
        throw InvalidParameter("eps must be a positive number, got " + std::to_string(eps));
    }
    if (minPts < 1) {
        throw InvalidParameter("minPts must be at least 1, got " + std::to_string(minPts));
    }
}

std::vector<std::vector<size_t>> Clustering::regionQueries(const std::vector<std::vector<double>>& points,
                                                            double eps) {
    const size_t n = points.size();
    std::vector<std::vector<size_t>> neighbors(n);

    // Distance is symmetric: compute each pair once. Pushing j in ascending
    // order for every i keeps the lists sorted.
    std::vector<std::vector<double>> distance(n, std::vector<double>(n, 0.0));
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i; j < n; ++j) {
            double d = cosineDistance(points[i], points[j]);
            distance[i][j] = d;
            distance[j][i] = d;
        }
    }

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = 0; j < n; ++j) {
            if (distance[i][j] <= eps) {
                neighbors[i].push_back(j);
            }
        }
    }

    return neighbors;
}

DbscanResult Clustering::dbscan(const std::vector<std::vector<double>>& points, double eps, int minPts) {
    validateParameters(eps, minPts);

    const size_t n = points.size();
    for (size_t i = 1; i < n; ++i) {
        if (points[i].size() != points[0].size()) {
            throw std::invalid_argument("All points must have the same dimension (point " +
                                        std::to_string(i) + " has " + std::to_string(points[i].size()) +
                                        ", expected " + std::to_string(points[0].size()) + ")");
        }
    }

    DbscanResult result;
    result.labels.assign(n, kNoiseLabel);
    result.core.assign(n, false);

    auto neighbors = regionQueries(points, eps);
    for (size_t i = 0; i < n; ++i) {
        result.core[i] = neighbors[i].size() >= static_cast<size_t>(minPts);
    }

    std::vector<bool> assigned(n, false);

    for (size_t seed = 0; seed < n; ++seed) {
        if (!result.core[seed] || assigned[seed]) continue;

        const int label = result.clusterCount++;

        // BFS over density-reachable points
        std::queue<size_t> q;
        q.push(seed);
        assigned[seed] = true;
        result.labels[seed] = label;

        while (!q.empty()) {
            size_t current = q.front();
            q.pop();

            // Border points join the cluster but do not expand it
            if (!result.core[current]) continue;

            for (size_t neighbor : neighbors[current]) {
                if (!assigned[neighbor]) {
                    assigned[neighbor] = true;
                    result.labels[neighbor] = label;
                    q.push(neighbor);
                }
            }
        }
    }

    return result;
}

std::vector<int> Clustering::cluster(const std::vector<std::vector<double>>& points, double eps, int minPts) {
    return dbscan(points, eps, minPts).labels;
}

} // namespace intentcluster
