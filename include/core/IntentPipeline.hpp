#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "core/ResultAggregator.hpp"
#include "nlp/TextNormalizer.hpp"

namespace intentcluster {

// Points handed to DBSCAN
enum class ClusterSpace {
    SimilarityRows,  // rows of the similarity matrix (default)
    FeatureVectors,  // dense TF-IDF vectors
};

const char* to_string(ClusterSpace space);
ClusterSpace clusterSpaceFromString(const std::string& name);

struct ClusteringParams {
    double eps = DEFAULT_EPS;
    int minPts = DEFAULT_MIN_PTS;
    ClusterSpace space = ClusterSpace::SimilarityRows;
};

struct ClusteringResult {
    std::vector<int> labels;      // one per utterance, kNoiseLabel for noise
    std::vector<bool> core;       // one per utterance
    ClusterGroups groups;
    int clustersFound = 0;
    size_t noiseCount = 0;
    size_t utterancesProcessed = 0;
    size_t vocabularySize = 0;
    size_t emptyVectors = 0;      // utterances with no content tokens

    nlohmann::json to_json() const;
    std::string to_str() const;
};

/**
 * Normalize -> TF-IDF -> cosine similarity -> DBSCAN -> grouping.
 * Stateless between runs: the same batch and parameters give the same partition.
 */
class IntentPipeline {
public:
    // The normalizer must outlive the pipeline
    explicit IntentPipeline(const nlp::ITextNormalizer& normalizer, bool verbose = false);

    // Throws InvalidParameter before doing any work if eps <= 0 or minPts < 1
    ClusteringResult run(const std::vector<std::string>& utterances, const ClusteringParams& params) const;

    void setVerbose(bool verbose) { verbose_ = verbose; }

private:
    const nlp::ITextNormalizer& normalizer_;
    bool verbose_;
};

} // namespace intentcluster
